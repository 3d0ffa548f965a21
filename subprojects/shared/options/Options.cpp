#include "Options.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <utility>
#include <iostream>

#ifndef TASKFLEET_VERSION
#define TASKFLEET_VERSION "0.1"
#endif

namespace shared_opts {

struct ProviderHolder { std::function<void(CLI::App&, const nlohmann::json&)> cb; };

static std::vector<ProviderHolder>& providers() {
    static std::vector<ProviderHolder> p;
    return p;
}

// Store the loaded config file path (if any) so that option providers can resolve relative paths.
static std::optional<std::filesystem::path>& loaded_config_file_storage() {
    static std::optional<std::filesystem::path> p; return p;
}

static nlohmann::ordered_json& ordered_config_storage() {
    static nlohmann::ordered_json j; return j;
}

std::mutex& Options::providers_mutex() {
    static std::mutex m;
    return m;
}

void Options::add_provider(Provider p) {
    std::lock_guard<std::mutex> lk(providers_mutex());
    providers().push_back(ProviderHolder{std::move(p)});
}

Options::ParseResult Options::load_and_parse(int argc, char** argv, std::string& err) {
    CLI::App app{"taskfleet - mailbox and task dispatch for a fleet of CLI workers"};
    app.set_version_flag("-V,--version", std::string{"taskfleet " TASKFLEET_VERSION});

    std::string config_file;
    app.add_option("-c,--config", config_file, "JSON config file to load")->group("General");

    // Allow extra args while scanning for the config file path; the strict parse
    // runs after every provider has registered its options and subcommands.
    app.allow_extras(true);

    CLI::App config_prescan{"config_prescan"};
    config_prescan.add_option("-c,--config", config_file);
    config_prescan.allow_extras(true);
    try {
        config_prescan.parse(argc, argv);
    } catch (const CLI::ParseError&) {
        // Unknown subcommands and options are expected here.
    }

    nlohmann::json cfg_json;
    ordered_config_storage() = nullptr;
    loaded_config_file_storage().reset();
    if (!config_file.empty()) {
        std::ifstream ifs(config_file);
        if (!ifs) {
            err = "cannot open config file " + config_file;
            return ParseResult::Error;
        }
        std::stringstream buffer;
        buffer << ifs.rdbuf();
        const std::string text = buffer.str();
        // Malformed JSON leaves cfg_json null: every section falls back to its defaults.
        cfg_json = nlohmann::json::parse(text, nullptr, false);
        if (cfg_json.is_discarded()) {
            std::cerr << "[WARNING] config file " << config_file << " is not valid JSON; using defaults" << std::endl;
            cfg_json = nullptr;
        } else {
            ordered_config_storage() = nlohmann::ordered_json::parse(text, nullptr, false);
        }
        std::error_code ec;
        auto abs = std::filesystem::absolute(config_file, ec);
        if (!ec) loaded_config_file_storage() = abs;
    }

    {
        std::lock_guard<std::mutex> lk(providers_mutex());
        for (auto &ph : providers()) {
            if (ph.cb) ph.cb(app, cfg_json);
        }
    }

    app.allow_extras(false);
    app.require_subcommand(1);
    try {
        app.parse(argc, argv);
        return ParseResult::Ok;
    } catch (const CLI::CallForHelp &) {
        std::cout << app.help() << std::endl;
        return ParseResult::Help;
    } catch (const CLI::CallForAllHelp &) {
        std::cout << app.help() << std::endl;
        return ParseResult::Help;
    } catch (const CLI::CallForVersion &v) {
        std::cout << v.what() << std::endl;
        return ParseResult::Version;
    } catch (const std::exception &e) {
        err = e.what();
        return ParseResult::Error;
    }
}

std::optional<std::filesystem::path> Options::get_config_dir() {
    auto &s = loaded_config_file_storage();
    if (s && s->has_parent_path()) return s->parent_path();
    return std::nullopt;
}

std::optional<std::filesystem::path> Options::get_config_file() {
    return loaded_config_file_storage();
}

nlohmann::ordered_json Options::get_ordered_config() {
    auto j = ordered_config_storage();
    if (j.is_discarded()) return nullptr;
    return j;
}

}
