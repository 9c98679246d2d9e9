#include <resolvit/ledger/config.hpp>

#include <resolvit/common/error.hpp>
#include <resolvit/common/log.hpp>

#include <cstdio>
#include <fstream>
#include <random>
#include <sstream>

namespace resolvit::ledger {

    namespace {
        std::optional<std::string> readText(const std::string &path) {
            std::ifstream in(path, std::ios::binary);
            if (!in) {
                return std::nullopt;
            }
            std::ostringstream ss;
            ss << in.rdbuf();
            return ss.str();
        }

        template <typename T> std::optional<T> optionalField(const json::Value &j, const char *key) {
            auto it = j.find(key);
            if (it == j.end() || it->is_null()) {
                return std::nullopt;
            }
            return it->template get<T>();
        }
    } // namespace

    std::string generateUuid() {
        static thread_local std::mt19937_64 rng{std::random_device{}()};
        std::uniform_int_distribution<uint64_t> dist;
        uint64_t hi = dist(rng);
        uint64_t lo = dist(rng);

        hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; // version 4
        lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL; // RFC 4122 variant

        char buf[37];
        std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx", static_cast<unsigned>(hi >> 32),
                      static_cast<unsigned>((hi >> 16) & 0xFFFF), static_cast<unsigned>(hi & 0xFFFF),
                      static_cast<unsigned>(lo >> 48), static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
        return std::string(buf);
    }

    dp::Result<LedgerConfig, dp::Error> LedgerConfig::fromJson(const json::Value &j) {
        if (!j.is_object()) {
            return dp::Result<LedgerConfig, dp::Error>::err(pool_config_error("Ledger config entry must be an object"));
        }

        LedgerConfig config;
        try {
            config.id = optionalField<std::string>(j, "id").value_or("");
            if (config.id.empty()) {
                config.id = generateUuid();
            }
            config.pool_name = optionalField<std::string>(j, "pool_name").value_or(config.id);
            config.is_production = optionalField<bool>(j, "is_production").value_or(true);
            config.is_write = optionalField<bool>(j, "is_write").value_or(false);
            config.genesis_transactions = optionalField<std::string>(j, "genesis_transactions").value_or("");
            config.genesis_file = optionalField<std::string>(j, "genesis_file").value_or("");
            config.keepalive = optionalField<int>(j, "keepalive").value_or(5);
            config.read_only = optionalField<bool>(j, "read_only").value_or(false);
            config.socks_proxy = optionalField<std::string>(j, "socks_proxy");
            config.endorser_did = optionalField<std::string>(j, "endorser_did");
            config.endorser_alias = optionalField<std::string>(j, "endorser_alias");
        } catch (const nlohmann::json::exception &e) {
            return dp::Result<LedgerConfig, dp::Error>::err(
                pool_config_error(std::string("Invalid ledger config entry: ") + e.what()));
        }

        if (config.keepalive < 0) {
            return dp::Result<LedgerConfig, dp::Error>::err(
                pool_config_error("Ledger '" + config.id + "': keepalive must not be negative"));
        }

        if (config.genesis_transactions.empty() && !config.genesis_file.empty()) {
            auto text = readText(config.genesis_file);
            if (!text) {
                return dp::Result<LedgerConfig, dp::Error>::err(
                    pool_config_error("Ledger '" + config.id + "': cannot read genesis file " + config.genesis_file));
            }
            config.genesis_transactions = *text;
        }

        return dp::Result<LedgerConfig, dp::Error>::ok(config);
    }

    json::Value LedgerConfig::toJson() const {
        json::Value j;
        j["id"] = id;
        j["pool_name"] = pool_name;
        j["is_production"] = is_production;
        j["is_write"] = is_write;
        if (!genesis_transactions.empty())
            j["genesis_transactions"] = genesis_transactions;
        if (!genesis_file.empty())
            j["genesis_file"] = genesis_file;
        j["keepalive"] = keepalive;
        j["read_only"] = read_only;
        if (socks_proxy)
            j["socks_proxy"] = *socks_proxy;
        if (endorser_did)
            j["endorser_did"] = *endorser_did;
        if (endorser_alias)
            j["endorser_alias"] = *endorser_alias;
        return j;
    }

    dp::Result<std::vector<LedgerConfig>, dp::Error> parseLedgerConfigList(const std::string &text) {
        auto doc = json::parse(text);
        if (doc.is_discarded()) {
            return dp::Result<std::vector<LedgerConfig>, dp::Error>::err(
                pool_config_error("Ledger configuration is not valid JSON"));
        }

        const json::Value *entries = &doc;
        if (doc.is_object()) {
            auto it = doc.find("ledgers");
            if (it == doc.end()) {
                return dp::Result<std::vector<LedgerConfig>, dp::Error>::err(
                    pool_config_error("Ledger configuration object has no 'ledgers' array"));
            }
            entries = &(*it);
        }
        if (!entries->is_array()) {
            return dp::Result<std::vector<LedgerConfig>, dp::Error>::err(
                pool_config_error("Ledger configuration must be a list"));
        }

        std::vector<LedgerConfig> configs;
        for (const auto &entry : *entries) {
            auto config = LedgerConfig::fromJson(entry);
            if (config.is_err()) {
                return dp::Result<std::vector<LedgerConfig>, dp::Error>::err(config.error());
            }
            configs.push_back(config.value());
        }
        log::debug("config", "Loaded " + std::to_string(configs.size()) + " ledger configuration(s)");
        return dp::Result<std::vector<LedgerConfig>, dp::Error>::ok(configs);
    }

    dp::Result<std::vector<LedgerConfig>, dp::Error> loadLedgerConfigFile(const std::string &path) {
        auto text = readText(path);
        if (!text) {
            return dp::Result<std::vector<LedgerConfig>, dp::Error>::err(
                pool_config_error("Cannot read ledger configuration file " + path));
        }
        return parseLedgerConfigList(*text);
    }

} // namespace resolvit::ledger
