#pragma once

#include <string>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include "vecshard/errors.hpp"
#include "reader.hpp"
#include "search_index.hpp"
#include "writer.hpp"

namespace vecshard::engine {

    struct Config {
        // nlohmann converts -1 to a huge size_t without complaint, so the sign is checked first.
        static void read_size(const nlohmann::json& j, const char* name, size_t& target) {
            if (!j.contains(name)) return;
            if (!j[name].is_number_unsigned()) {
                throw ValidationError(std::string(name) + " must be a non-negative integer");
            }
            target = j[name].get<size_t>();
        }

        size_t embedding_dim = Writer::kDefaultDimension;
        size_t shard_size = Writer::kDefaultShardSize;
        std::string scratch_dir = "";           // empty: system temp dir
        std::string scratch_backing = "file";   // file, anonymous
        std::string metric = "l2";              // l2, ip
        size_t default_k = 8;
        size_t ef_search = 64;

        /**
         * @brief Reads a JSON config. A missing file yields the defaults.
         * @throws ValidationError on malformed JSON or out-of-range values.
         */
        static Config load(const std::filesystem::path& path) {
            Config cfg;
            if (!std::filesystem::exists(path)) return cfg;

            try {
                std::ifstream f(path);
                nlohmann::json j = nlohmann::json::parse(f);

                read_size(j, "embedding_dim", cfg.embedding_dim);
                read_size(j, "shard_size", cfg.shard_size);
                if (j.contains("scratch_dir")) cfg.scratch_dir = j["scratch_dir"].get<std::string>();
                if (j.contains("scratch_backing")) cfg.scratch_backing = j["scratch_backing"].get<std::string>();
                if (j.contains("metric")) cfg.metric = j["metric"].get<std::string>();
                read_size(j, "default_k", cfg.default_k);
                read_size(j, "ef_search", cfg.ef_search);
            } catch (const nlohmann::json::exception& e) {
                throw ValidationError("bad config " + path.string() + ": " + e.what());
            }

            cfg.validate();
            return cfg;
        }

        void save(const std::filesystem::path& path) const {
            nlohmann::json j;
            j["embedding_dim"] = embedding_dim;
            j["shard_size"] = shard_size;
            j["scratch_dir"] = scratch_dir;
            j["scratch_backing"] = scratch_backing;
            j["metric"] = metric;
            j["default_k"] = default_k;
            j["ef_search"] = ef_search;

            std::ofstream f(path);
            f << j.dump(4);
            if (!f) throw IoError("cannot write config " + path.string());
        }

        void validate() const {
            if (embedding_dim == 0) throw ValidationError("embedding_dim must be positive");
            if (shard_size == 0) throw ValidationError("shard_size must be positive");
            if (scratch_backing != "file" && scratch_backing != "anonymous") {
                throw ValidationError("scratch_backing must be 'file' or 'anonymous'");
            }
            parse_metric(metric);
        }

        ScratchOptions scratch_options() const {
            ScratchOptions opts;
            opts.backing = scratch_backing == "anonymous" ? ScratchMappedArray::Backing::Anonymous
                                                          : ScratchMappedArray::Backing::TempFile;
            opts.directory = scratch_dir;
            return opts;
        }
    };

}
