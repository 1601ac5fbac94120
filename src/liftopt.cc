/**
 * Copyright (c) 2026, Timothy Stack
 *
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * * Redistributions of source code must retain the above copyright notice, this
 * list of conditions and the following disclaimer.
 * * Redistributions in binary form must reproduce the above copyright notice,
 * this list of conditions and the following disclaimer in the documentation
 * and/or other materials provided with the distribution.
 * * Neither the name of Timothy Stack nor the names of its contributors
 * may be used to endorse or promote products derived from this software
 * without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE REGENTS AND CONTRIBUTORS ''AS IS'' AND ANY
 * EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE REGENTS OR CONTRIBUTORS BE LIABLE FOR ANY
 * DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 * (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 * ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#include <string>
#include <vector>

#include <stdio.h>
#include <stdlib.h>
#include <sys/types.h>

#include "CLI/CLI.hpp"
#include "base/fold.hh"
#include "base/itertools.hh"
#include "base/liftopt_log.hh"
#include "base/maybe.fmt.hh"
#include "base/maybe.hh"
#include "base/opt_util.hh"
#include "checked_seq.hh"
#include "config.h"
#include "fmt/format.h"
#include "fmt/ranges.h"
#include "heap_ops.hh"
#include "quadratic.hh"

using namespace liftopt;

static std::string
pair_to_string(const maybe<std::pair<double, double>>& roots)
{
    return roots.match(
        [](const auto& pair) {
            return fmt::format(
                FMT_STRING("Some(({}, {}))"), pair.first, pair.second);
        },
        [] { return std::string("Nothing"); });
}

static void
print_seq(const checked_seq<double>& seq)
{
    std::vector<std::string> parts;

    seq.values() | itertools::for_each([&parts](double value) {
        parts.emplace_back(fmt::format(FMT_STRING("{}"), value));
    });
    fmt::print(FMT_STRING("[{}]\n"), fmt::join(parts, ", "));
}

static void
configure_logging(const std::string& debug_log, bool verbose)
{
    auto env_level = getenv_opt("LIFTOPT_LOG_LEVEL")
        | itertools::flat_map(log_level_from_string);

    liftopt_log_level = env_level.unwrap_or(liftopt_log_level);
    if (verbose) {
        liftopt_log_level = liftopt_log_level_t::DEBUG;
    }

    if (!debug_log.empty()) {
        auto* file = fopen(debug_log.c_str(), "ae");

        if (file == nullptr) {
            fmt::print(stderr,
                       FMT_STRING("warning: unable to open debug log: {}\n"),
                       debug_log);
        } else {
            liftopt_log_file = file;
        }
    }
}

int
main(int argc, char* argv[])
{
    std::string debug_log;
    bool verbose = false;
    std::vector<double> coefficients;
    ssize_t position = 0;
    std::vector<double> values;
    std::vector<std::string> candidates;

    CLI::App app{"Absence-propagating arithmetic demos"};

    app.add_option("-d", debug_log, "Write debug messages to the given file.")
        ->type_name("FILE");
    app.add_flag("-v", verbose, "Log at the debug level");
    app.set_version_flag("-V,--version");
    app.footer(fmt::format(FMT_STRING("Version: {}"), PACKAGE_STRING));
    app.require_subcommand(1);

    auto* roots_cmd
        = app.add_subcommand("roots", "Solve a*x^2 + b*x + c = 0");
    roots_cmd->add_option("coefficients", coefficients, "a b c")
        ->required()
        ->expected(3);

    auto* get_cmd = app.add_subcommand(
        "get", "Look up an index with a bounds-checked accessor");
    get_cmd->add_option("index", position, "The index")->required();
    get_cmd->add_option("values", values, "The sequence");

    auto* sift_cmd = app.add_subcommand(
        "sift-down", "Sift an element of a min-heap down to its place");
    sift_cmd->add_option("index", position, "The index")->required();
    sift_cmd->add_option("values", values, "The heap");

    auto* min_cmd = app.add_subcommand(
        "min", "The smallest of the candidates that are numbers");
    min_cmd->add_option("candidates", candidates, "The candidates");

    try {
        app.parse(argc, argv);
    } catch (const CLI::CallForHelp& e) {
        fmt::print(FMT_STRING("{}\n"), app.help());
        return EXIT_SUCCESS;
    } catch (const CLI::CallForVersion& e) {
        fmt::print(FMT_STRING("{}\n"), PACKAGE_STRING);
        return EXIT_SUCCESS;
    } catch (const CLI::ParseError& e) {
        fmt::print(
            stderr, FMT_STRING("error: invalid command-line arguments: {}\n"),
            e.what());
        return e.get_exit_code();
    }

    configure_logging(debug_log, verbose);
    log_argv(argc, argv);

    try {
        if (roots_cmd->parsed()) {
            auto a = coefficients[0];
            auto b = coefficients[1];
            auto c = coefficients[2];
            auto roots = quadratic::roots(a, b, c);

            log_debug("solving %g*x^2 + %g*x + %g", a, b, c);
            fmt::print(FMT_STRING("{}\n{}\n"), roots.first, roots.second);
            fmt::print(FMT_STRING("{}\n"),
                       pair_to_string(quadratic::roots_do(a, b, c)));
        } else if (get_cmd->parsed()) {
            checked_seq<double> seq(values);

            fmt::print(FMT_STRING("{}\n"), seq[position]);
        } else if (sift_cmd->parsed()) {
            checked_seq<double> seq(values);

            auto final_index = heap::sift_down(position, seq);
            log_debug("element at %zd settled at %zd", position, final_index);
            print_seq(seq);
        } else if (min_cmd->parsed()) {
            std::vector<maybe<double>> numbers;

            for (const auto& cand : candidates) {
                numbers.emplace_back(scan_double(cand));
            }
            auto smallest
                = numbers | itertools::fold_present([](double lhs, double rhs) {
                      return rhs < lhs ? rhs : lhs;
                  });
            log_debug("%zu of %zu candidates are numbers",
                      (numbers | itertools::present_values()).size(),
                      numbers.size());
            fmt::print(FMT_STRING("{}\n"), smallest);
        }
    } catch (const absent_value_error& e) {
        log_error("unexpected absent value: %s", e.what());
        fmt::print(stderr, FMT_STRING("internal error: {}\n"), e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
