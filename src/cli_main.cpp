/**
 * @file cli_main.cpp
 * @brief jtransform command-line tool
 */

#include <cxxopts.hpp>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "jtransform/Errors.hpp"
#include "jtransform/Loader.hpp"
#include "jtransform/Transformer.hpp"

using namespace jtransform;

namespace {

ArrayMergeHandling parse_array_merge(const std::string& mode) {
    if (mode == "merge") return ArrayMergeHandling::Merge;
    if (mode == "concat") return ArrayMergeHandling::Concat;
    if (mode == "union") return ArrayMergeHandling::Union;
    if (mode == "replace") return ArrayMergeHandling::Replace;
    throw std::invalid_argument("Unknown --array-merge mode: " + mode +
                                " (expected merge, concat, union or replace)");
}

Value errors_to_json(const std::vector<PathError>& errors) {
    Value out = Value::array();
    for (const auto& e : errors) {
        out.push_back(Value{{"path", e.path}, {"message", e.message}});
    }
    return out;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("jtransform", "Apply a transformation document to a JSON/TOML document");

        options.add_options()
            ("s,source", "Source document (JSON or TOML)", cxxopts::value<std::string>())
            ("t,transform", "Transformation document (JSON or TOML)", cxxopts::value<std::string>())
            ("state", "JSON/TOML file with state passed to commands", cxxopts::value<std::string>())
            ("o,out", "Write the result here instead of stdout", cxxopts::value<std::string>())
            ("indent", "Indentation of the result JSON (-1 for compact)", cxxopts::value<int>()->default_value("2"))
            ("max-depth", "Maximum foreach nesting", cxxopts::value<std::size_t>()->default_value("32"))
            ("array-merge", "Array merge mode: merge|concat|union|replace", cxxopts::value<std::string>()->default_value("merge"))
            ("errors-json", "Print errors as a JSON array on stderr")
            ("h,help", "Show help");

        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        if (!result.count("source") || !result.count("transform")) {
            std::cerr << "Error: --source and --transform are required\n";
            std::cerr << options.help() << "\n";
            return 1;
        }

        TransformOptions opts;
        opts.max_depth = result["max-depth"].as<std::size_t>();
        opts.merge.arrays = parse_array_merge(result["array-merge"].as<std::string>());

        Value source = load_document_file(result["source"].as<std::string>());
        Value transformation = load_document_file(result["transform"].as<std::string>());
        Value state = Value::object();
        if (result.count("state")) {
            state = load_document_file(result["state"].as<std::string>());
        }

        TransformationResult out = transform_with_state(source, transformation, std::move(state), opts);

        const std::string text = out.value.dump(result["indent"].as<int>());
        if (result.count("out")) {
            const std::string path = result["out"].as<std::string>();
            std::ofstream ofs(path);
            if (!ofs) {
                std::cerr << "Error: cannot write to " << path << "\n";
                return 1;
            }
            ofs << text << "\n";
        } else {
            std::cout << text << "\n";
        }

        if (result.count("errors-json")) {
            if (!out.ok()) std::cerr << errors_to_json(out.errors).dump(2) << "\n";
        } else {
            for (const auto& e : out.errors) {
                std::cerr << "error: " << e.path << ": " << e.message << "\n";
            }
        }

        return out.ok() ? 0 : 2;

    } catch (const TransformError& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
