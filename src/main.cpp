#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <cstdlib>
#include <filesystem>
#include <nlohmann/json.hpp>

#include "platform.hpp"
#include "engine/config.hpp"
#include "engine/neighbor_search.hpp"
#include "engine/reader.hpp"
#include "engine/tsv_import.hpp"
#include "engine/writer.hpp"
#include "cli/options.hpp"
#include "vecshard/errors.hpp"

using json = nlohmann::json;
using vecshard::cli::parse_size;
using vecshard::cli::take_option;

namespace {

    void print_usage() {
        std::cerr << "Usage: vecshard [--config <file>] <command> [args...]\n";
        std::cerr << "Commands:\n";
        std::cerr << "  import <store> <vectors.tsv> [--dim D] [--shard-size N]\n";
        std::cerr << "                             - Append 'key<TAB>v1<TAB>v2...' lines to a store\n";
        std::cerr << "  info <store>               - Table shape and shard list\n";
        std::cerr << "  ids <store>                - Print every key in id order\n";
        std::cerr << "  get <store> <key>          - Vector stored under a key\n";
        std::cerr << "  get-id <store> <id>        - Vector stored at an id\n";
        std::cerr << "  query <store> <key> [-k K] - Nearest neighbors of a stored key\n";
    }

    int cmd_import(const vecshard::engine::Config& config, std::vector<std::string> args) {
        std::string value;
        size_t dim = config.embedding_dim;
        size_t shard_size = config.shard_size;
        if (take_option(args, "--dim", value)) dim = parse_size(value, "dimension");
        if (take_option(args, "--shard-size", value)) shard_size = parse_size(value, "shard size");
        if (args.size() != 2) {
            print_usage();
            return 1;
        }

        std::ifstream input(args[1]);
        if (!input.is_open()) {
            std::cerr << "Error: cannot open " << args[1] << "\n";
            return 1;
        }

        vecshard::engine::Writer writer(args[0], dim, shard_size);
        writer.open();
        auto stats = vecshard::engine::import_tsv(input, writer);
        writer.close();

        json res;
        res["imported"] = stats.imported;
        res["skipped"] = stats.skipped;
        res["size"] = writer.size();
        res["shards"] = writer.shard_count();
        std::cout << res.dump() << "\n";
        return 0;
    }

    int cmd_info(const vecshard::engine::Config& config, const std::vector<std::string>& args) {
        if (args.size() != 1) {
            print_usage();
            return 1;
        }
        vecshard::engine::Reader reader(args[0], config.scratch_options());
        reader.open();

        json shards = json::array();
        for (const auto& s : reader.shards()) {
            shards.push_back({{"shard", s.filename}, {"shard_id", s.shard_id}, {"n", s.n}, {"d", s.d}});
        }
        json res;
        res["size"] = reader.size();
        res["dimension"] = reader.dimension();
        res["shards"] = shards;
        std::cout << res.dump(2) << "\n";
        return 0;
    }

    int cmd_ids(const vecshard::engine::Config& config, const std::vector<std::string>& args) {
        if (args.size() != 1) {
            print_usage();
            return 1;
        }
        vecshard::engine::Reader reader(args[0], config.scratch_options());
        reader.open();
        reader.for_each_id([](vecshard::EntryId, const std::string& key) { std::cout << key << "\n"; });
        return 0;
    }

    int cmd_get(const vecshard::engine::Config& config, const std::vector<std::string>& args, bool by_id) {
        if (args.size() != 2) {
            print_usage();
            return 1;
        }
        vecshard::engine::Reader reader(args[0], config.scratch_options());
        reader.open();

        std::vector<float> vec;
        if (by_id) {
            vec = reader.get_by_id(static_cast<vecshard::EntryId>(std::stoll(args[1])));
        } else {
            vec = reader.get_by_key(args[1]);
        }
        std::cout << json(vec).dump() << "\n";
        return 0;
    }

    int cmd_query(const vecshard::engine::Config& config, std::vector<std::string> args) {
        std::string value;
        size_t k = config.default_k;
        if (take_option(args, "-k", value)) k = parse_size(value, "k");
        if (args.size() != 2) {
            print_usage();
            return 1;
        }

        auto search = vecshard::engine::load_neighbor_search(args[0],
                                                             vecshard::engine::parse_metric(config.metric),
                                                             config.ef_search,
                                                             config.scratch_options());
        auto neighbors = search->nearest_neighbors(search->embedding(args[1]), k);

        json res = json::array();
        for (const auto& n : neighbors) {
            res.push_back({{"key", n.key}, {"distance", n.distance}});
        }
        std::cout << res.dump(2) << "\n";
        return 0;
    }

}

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    std::filesystem::path config_path;
    std::string value;
    if (take_option(args, "--config", value)) {
        config_path = value;
    } else {
        auto config_dir = vecshard::platform::system::get_config_dir();
        if (!config_dir.empty()) config_path = config_dir / "config.json";
    }

    if (args.empty()) {
        print_usage();
        return 1;
    }

    std::string command = args.front();
    args.erase(args.begin());

    try {
        auto config = config_path.empty() ? vecshard::engine::Config() : vecshard::engine::Config::load(config_path);

        if (command == "import") return cmd_import(config, args);
        if (command == "info") return cmd_info(config, args);
        if (command == "ids") return cmd_ids(config, args);
        if (command == "get") return cmd_get(config, args, false);
        if (command == "get-id") return cmd_get(config, args, true);
        if (command == "query") return cmd_query(config, args);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Error: unknown command '" << command << "'\n";
    print_usage();
    return 1;
}
