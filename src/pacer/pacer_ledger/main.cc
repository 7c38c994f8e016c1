/*
 * Copyright 2024 Redpanda Data, Inc.
 *
 * Use of this software is governed by the Business Source License
 * included in the file licenses/BSL.md
 *
 * As of the Change Date specified in that file, in accordance with
 * the Business Source License, use of this software will be governed
 * by the Apache License, Version 2.0
 */

#include "base/seastarx.h"
#include "config/configuration.h"
#include "json/json.h"
#include "upload/ledger_store.h"
#include "upload/types.h"

#include <seastar/core/app-template.hh>
#include <seastar/core/coroutine.hh>

#include <boost/program_options.hpp>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>

namespace {

struct ledger_cmd {
    std::filesystem::path dir;
    std::optional<ss::sstring> queue;
    bool reset{false};
    bool clear_cooldown{false};
};

ss::future<int> run_ledger_cmd(ledger_cmd cmd) {
    upload::file_ledger_store store(cmd.dir);
    co_await store.start();

    if (cmd.queue.has_value()) {
        const auto& q = cmd.queue.value();
        auto ledger = co_await store.load(q);
        if (ledger.has_value()) {
            fmt::print("queue {}: {}\n", q, ledger.value());
        } else {
            fmt::print("queue {}: {}\n", q, ledger.error().message());
        }
        if (cmd.reset) {
            auto ec = co_await store.remove(q);
            if (ec) {
                std::cerr << fmt::format(
                  "can't remove ledger of queue {}: {}\n", q, ec.message());
                co_return 1;
            }
            fmt::print("queue {}: ledger removed\n", q);
        }
    }

    auto deadline = co_await store.load_cooldown();
    if (deadline.has_value()) {
        auto left = std::max(
          std::chrono::ceil<std::chrono::seconds>(
            deadline.value() - std::chrono::system_clock::now()),
          std::chrono::seconds(0));
        fmt::print("account cooldown: {} left\n", left);
    } else {
        fmt::print("account cooldown: {}\n", deadline.error().message());
    }
    if (cmd.clear_cooldown) {
        auto ec = co_await store.save_cooldown(std::nullopt);
        if (ec) {
            std::cerr << fmt::format(
              "can't clear account cooldown: {}\n", ec.message());
            co_return 1;
        }
        fmt::print("account cooldown cleared\n");
    }
    co_return 0;
}

int run_app(char** argv, ledger_cmd cmd) {
    seastar::app_template app;
    try {
        return app.run(1, argv, [cmd = std::move(cmd)]() mutable {
            return run_ledger_cmd(std::move(cmd));
        });
    } catch (...) {
        std::cerr << std::current_exception() << "\n";
        return 1;
    }
}

} // namespace

/**
 * Operator utility for the files the orchestrator keeps on disk: progress
 * ledgers and the account cooldown deadline. Run it only while no
 * orchestrator is using the same directory.
 */
int main(int ac, char* av[]) {
    namespace po = boost::program_options;
    po::options_description desc("Allowed options");

    // clang-format off
    desc.add_options()
      ("help", "Allowed options")
      ("config", po::value<std::filesystem::path>(), "YAML configuration file")
      ("print_config", "Print the effective configuration as JSON")
      ("dir", po::value<std::filesystem::path>(), "Ledger directory, overrides pacer_ledger_directory")
      ("queue", po::value<std::string>(), "Queue to inspect")
      ("reset", "Remove the ledger of --queue")
      ("clear_cooldown", "Remove the persisted account cooldown");
    // clang-format on

    po::variables_map vm;
    po::store(po::parse_command_line(ac, av, desc), vm);
    po::notify(vm);

    if (vm.count("help")) {
        std::cout << desc << "\n";
        return 0;
    }

    auto& cfg = config::shard_local_cfg();
    if (vm.count("config")) {
        auto path = vm["config"].as<std::filesystem::path>();
        auto errors = cfg.load(YAML::LoadFile(path.string()));
        for (const auto& [name, error] : errors) {
            std::cerr << fmt::format("{}: {}\n", name, error);
        }
        if (!errors.empty()) {
            return 1;
        }
    }

    // Reject inconsistent pacing windows before touching any file
    try {
        auto oc = upload::get_orchestrator_config();
        auto window = upload::get_write_cooldown_window();
        if (vm.count("print_config")) {
            std::cerr << fmt::format(
              "orchestrator: {}\naccount guard: {}\nwrite cooldown: [{}, "
              "{}]\n",
              oc,
              upload::get_account_guard_config(),
              window.min,
              window.max);
        }
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    if (vm.count("print_config")) {
        json::StringBuffer buf;
        json::Writer<json::StringBuffer> w(buf);
        cfg.to_json(w);
        std::cout << buf.GetString() << "\n";
        return 0;
    }

    if (vm.count("reset") && !vm.count("queue")) {
        std::cerr << "--reset requires --queue\n";
        return 1;
    }

    ledger_cmd cmd{
      .dir = vm.count("dir") ? vm["dir"].as<std::filesystem::path>()
                             : std::filesystem::path(
                               upload::get_ledger_directory()),
      .reset = vm.count("reset") > 0,
      .clear_cooldown = vm.count("clear_cooldown") > 0,
    };
    if (vm.count("queue")) {
        cmd.queue = ss::sstring(vm["queue"].as<std::string>());
    }
    return run_app(av, std::move(cmd));
}
