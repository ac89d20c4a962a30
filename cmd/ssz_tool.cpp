// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <ssz/codec/container_codec.hpp>
#include <ssz/codec/decode_error.hpp>
#include <ssz/container/runtime_fixed_vector.hpp>
#include <ssz/container/runtime_variable_list.hpp>
#include <ssz/core/byte_string.hpp>
#include <ssz/core/bytes.hpp>
#include <ssz/core/fmt/bytes_fmt.hpp>
#include <ssz/core/log_level_map.hpp>
#include <ssz/merkle/container_tree_hash.hpp>
#include <ssz/merkle/gindex.hpp>
#include <ssz/merkle/proof.hpp>

#include <CLI/CLI.hpp>

#include <evmc/hex.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <fmt/format.h>

#include <cstdint>
#include <cstdlib>
#include <map>
#include <optional>
#include <string>
#include <utility>

using namespace ssz;

namespace
{
    enum class Shape
    {
        List,
        Vector,
    };

    enum class Element
    {
        U8,
        U16,
        U32,
        U64,
    };

    struct Options
    {
        Shape shape{Shape::List};
        Element element{Element::U8};
        uint64_t capacity{0};
        byte_string input{};
        std::optional<uint64_t> prove{};
    };

    template <class Container, class T>
    int report(
        Container const &container, bool const is_list, Options const &opts)
    {
        fmt::print("items: {}\n", container.size());
        fmt::print("encoded_len: {}\n", bytes_len(container));
        fmt::print("root: {}\n", merkle::tree_hash_root(container));

        if (!opts.prove.has_value()) {
            return EXIT_SUCCESS;
        }
        uint64_t const index = *opts.prove;
        if (index >= container.size()) {
            LOG_ERROR(
                "cannot prove item {} of a sequence of {} items",
                index,
                container.size());
            return EXIT_FAILURE;
        }
        merkle::gindex_t const g =
            is_list
                ? merkle::list_item_gindex<T>(1, opts.capacity, index)
                : merkle::vector_item_gindex<T>(1, opts.capacity, index);
        auto const proof = merkle::merkle_tree(container).generate_proof(g);
        if (proof.has_error()) {
            LOG_ERROR(
                "proof for gindex {} failed: {}",
                g,
                merkle::to_string(proof.error()));
            return EXIT_FAILURE;
        }
        fmt::print("gindex: {}\n", g);
        for (auto const &sibling : proof.value()) {
            fmt::print("proof: {}\n", sibling);
        }
        return EXIT_SUCCESS;
    }

    template <class T>
    int run(Options const &opts)
    {
        if (opts.shape == Shape::List) {
            auto const list =
                decode_runtime_variable_list<T>(opts.input, opts.capacity);
            if (list.has_error()) {
                LOG_ERROR("decoding failed: {}", list.error().message());
                return EXIT_FAILURE;
            }
            return report<RuntimeVariableList<T>, T>(list.value(), true, opts);
        }
        auto const vector =
            decode_runtime_fixed_vector<T>(opts.input, opts.capacity);
        if (vector.has_error()) {
            LOG_ERROR("decoding failed: {}", vector.error().message());
            return EXIT_FAILURE;
        }
        return report<RuntimeFixedVector<T>, T>(vector.value(), false, opts);
    }
}

int main(int const argc, char const *argv[])
{
    CLI::App cli{"ssz_tool"};
    cli.option_defaults()->always_capture_default();

    Options opts;
    std::string input_hex;
    uint64_t prove = 0;
    auto log_level = quill::LogLevel::Info;

    std::map<std::string, Shape> const shape_map = {
        {"list", Shape::List}, {"vector", Shape::Vector}};
    std::map<std::string, Element> const element_map = {
        {"u8", Element::U8},
        {"u16", Element::U16},
        {"u32", Element::U32},
        {"u64", Element::U64}};

    cli.add_option("--shape", opts.shape, "list or vector")
        ->transform(CLI::CheckedTransformer(shape_map, CLI::ignore_case));
    cli.add_option("--element", opts.element, "element type")
        ->transform(CLI::CheckedTransformer(element_map, CLI::ignore_case));
    cli.add_option(
           "--capacity",
           opts.capacity,
           "maximum length of a list, length of a vector")
        ->required();
    cli.add_option("--input", input_hex, "serialized sequence as hex")
        ->required();
    auto *const prove_opt =
        cli.add_option("--prove", prove, "print the proof of this item");
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(ascii_time) [%(thread)] %(filename):%(lineno) LOG_%(level_name)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    auto input = evmc::from_hex(input_hex);
    if (!input.has_value()) {
        LOG_ERROR("--input is not valid hex");
        return EXIT_FAILURE;
    }
    opts.input = std::move(*input);
    if (*prove_opt) {
        opts.prove = prove;
    }
    LOG_INFO(
        "decoding {} bytes, capacity {}", opts.input.size(), opts.capacity);

    switch (opts.element) {
    case Element::U8:
        return run<uint8_t>(opts);
    case Element::U16:
        return run<uint16_t>(opts);
    case Element::U32:
        return run<uint32_t>(opts);
    case Element::U64:
        return run<uint64_t>(opts);
    }
    return EXIT_FAILURE;
}
