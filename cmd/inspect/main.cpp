#include "biglist/biglist.hpp"
#include "biglist/codecs/json_codec.hpp"
#include "biglist/exception.hpp"
#include "biglist/log.hpp"
#include "biglist/upath.hpp"

#include "common/common.hpp"

#include <boost/program_options.hpp>
#include <fmt/ostream.h>
#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

using namespace std;
namespace po = boost::program_options;

using element_t = nlohmann::json;
using list_t = biglist::biglist<element_t>;

static string dataset_path;
static bool merge = false;
static bool list_files = false;
static size_t dump_count = 0;
static bool verbose = false;

void parse_options(int argc, char** argv);

// Datasets of arbitrary json elements can be read with the json based formats.
biglist::codec_registry<element_t> make_registry() {
    biglist::codec_registry<element_t> registry;
    registry.add("json", std::make_shared<biglist::json_codec<element_t>>());
    registry.add("json-gzip", std::make_shared<biglist::json_gzip_codec<element_t>>());
    return registry;
}

void print_summary(list_t& list) {
    const nlohmann::json& info = list.info();
    fmt::print(cout, "Dataset:         {}\n", list.path()->string());
    fmt::print(cout, "Storage format:  {}\n", list.storage_format());
    fmt::print(cout, "Storage version: {}\n", list.storage_version());
    fmt::print(cout, "Batch size:      {}\n", list.batch_size());
    fmt::print(cout, "Data files:      {}\n", list.num_data_files());
    fmt::print(cout, "Elements:        {}\n", list.num_data_items());

    for (auto it = info.begin(); it != info.end(); ++it) {
        if (it.key() == "data_files_info" || it.key() == "storage_format"
                || it.key() == "storage_version" || it.key() == "batch_size") {
            continue;
        }
        fmt::print(cout, "{}: {}\n", it.key(), it.value().dump());
    }
}

void print_files(list_t& list) {
    auto files = list.files();
    for (const biglist::data_file_info& f : files.data_files_info()) {
        fmt::print(cout, "{:>12} {:>12}  {}\n", f.count, f.cumcount, f.name);
    }
}

void print_elements(list_t& list, size_t count) {
    size_t printed = 0;
    for (auto it = list.begin(), end = list.end(); it != end && printed < count; ++it, ++printed) {
        fmt::print(cout, "{}\n", it->dump());
    }
}

int main(int argc, char** argv) {
    return run_main([&]{
        parse_options(argc, argv);
        if (!verbose) {
            biglist::log()->set_level(spdlog::level::warn);
        }

        try {
            list_t list(biglist::resolve_path(dataset_path), make_registry());
            if (merge) {
                // Without local changes this only folds pending interim records into the index.
                list.flush();
            } else {
                list.reload();
            }

            print_summary(list);
            if (list_files) {
                fmt::print(cout, "\n");
                print_files(list);
            }
            if (dump_count > 0) {
                fmt::print(cout, "\n");
                print_elements(list, dump_count);
            }
        } catch (const biglist::file_not_found_error& e) {
            fmt::print(cerr, "Not a dataset: {}\n", e.what());
            return 1;
        } catch (const biglist::unknown_format_error& e) {
            fmt::print(cerr, "Cannot read dataset: {}\n", e.what());
            return 1;
        } catch (const biglist::lock_acquire_error& e) {
            fmt::print(cerr, "Failed to merge: {}\n", e.what());
            return 1;
        }
        return 0;
    });
}

void parse_options(int argc, char** argv) {
    po::options_description options("Options");
    options.add_options()
            ("help,h", "Show this message.")
            ("path", po::value(&dataset_path)->value_name("PATH")->required(),
             "Path to the dataset directory.")
            ("merge", po::bool_switch(&merge),
             "Merge interim records of eager flushes into the index.")
            ("list-files", po::bool_switch(&list_files),
             "List all data files with their element counts.")
            ("dump", po::value(&dump_count)->value_name("N")->default_value(0),
             "Print the first N elements.")
            ("verbose,v", po::bool_switch(&verbose),
             "Show informational log messages.");

    po::positional_options_description pos;
    pos.add("path", 1);

    po::variables_map vm;
    try {
        po::command_line_parser p(argc, argv);
        p.options(options);
        p.positional(pos);
        po::store(p.run(), vm);

        if (vm.count("help")) {
            fmt::print(cerr, "Usage: {0} [OPTION...] PATH\n"
                             "\n"
                             "Print information about a dataset of json elements.\n"
                             "\n"
                             "{1}",
                       argv[0], fmt::streamed(options));
            throw exit_main(0);
        }

        po::notify(vm);
    } catch (const po::error& e) {
        fmt::print(cerr, "Failed to parse arguments: {}.\n", e.what());
        throw exit_main(1);
    }
}
