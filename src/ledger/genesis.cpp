#include <cstdlib>
#include <fstream>
#include <random>
#include <resolvit/common/digest.hpp>
#include <resolvit/common/error.hpp>
#include <resolvit/common/log.hpp>
#include <resolvit/ledger/genesis.hpp>
#include <sstream>

namespace resolvit::ledger {

    namespace {
        std::optional<std::string> readFile(const std::filesystem::path &path) {
            std::ifstream in(path, std::ios::binary);
            if (!in) {
                return std::nullopt;
            }
            std::ostringstream ss;
            ss << in.rdbuf();
            return ss.str();
        }

        std::string trim(const std::string &line) {
            const char *ws = " \t\r\n";
            size_t begin = line.find_first_not_of(ws);
            if (begin == std::string::npos)
                return "";
            size_t end = line.find_last_not_of(ws);
            return line.substr(begin, end - begin + 1);
        }
    } // namespace

    std::filesystem::path defaultStorageRoot() {
        if (const char *home = std::getenv("RESOLVIT_HOME")) {
            return std::filesystem::path(home) / "vdr";
        }
        if (const char *home = std::getenv("HOME")) {
            return std::filesystem::path(home) / ".resolvit" / "vdr";
        }
        return std::filesystem::temp_directory_path() / "resolvit" / "vdr";
    }

    GenesisStore::GenesisStore(std::filesystem::path root) : root_(std::move(root)) {}

    std::string GenesisStore::normalize(const std::string &transactions) {
        std::istringstream in(transactions);
        std::string out;
        std::string line;
        while (std::getline(in, line)) {
            line = trim(line);
            if (!line.empty()) {
                out += line;
                out += "\n";
            }
        }
        return out;
    }

    std::string GenesisStore::hash(const std::string &transactions) {
        std::string hex = sha256Hex(transactions);
        return hex.substr(hex.size() - 16);
    }

    std::filesystem::path GenesisStore::configPath(const std::string &pool_name) const {
        return root_ / pool_name / "genesis";
    }

    std::filesystem::path GenesisStore::cachePath(const std::string &pool_name, const std::string &genesis_hash) const {
        return root_ / pool_name / ("cache-" + genesis_hash);
    }

    bool GenesisStore::hasConfig(const std::string &pool_name) const {
        std::error_code ec;
        return std::filesystem::exists(configPath(pool_name), ec);
    }

    dp::Result<void, dp::Error> GenesisStore::writeConfig(const std::string &pool_name,
                                                          const std::string &transactions, bool recreate) {
        std::string genesis = normalize(transactions);
        if (genesis.empty()) {
            return dp::Result<void, dp::Error>::err(pool_config_error("Empty genesis transactions"));
        }

        auto path = configPath(pool_name);
        if (auto existing = readFile(path)) {
            if (normalize(*existing) == genesis) {
                log::debug("genesis", "Pool ledger config '" + pool_name + "' is consistent, skipping write");
                return dp::Result<void, dp::Error>::ok();
            }
            if (!recreate) {
                return dp::Result<void, dp::Error>::err(pool_config_error(
                    "Pool ledger '" + pool_name + "' exists with different genesis transactions"));
            }
        }

        auto written = writeSafe(path, genesis);
        if (!written.is_ok()) {
            return dp::Result<void, dp::Error>::err(
                pool_config_error("Error writing genesis transactions: " + errorText(written.error())));
        }
        log::debug("genesis", "Wrote pool ledger config '" + pool_name + "'");
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<std::string, dp::Error> GenesisStore::readConfig(const std::string &pool_name) const {
        auto content = readFile(configPath(pool_name));
        if (!content) {
            return dp::Result<std::string, dp::Error>::err(
                pool_config_error("Pool config '" + pool_name + "' not found"));
        }
        return dp::Result<std::string, dp::Error>::ok(normalize(*content));
    }

    std::optional<std::string> GenesisStore::readCache(const std::string &pool_name,
                                                       const std::string &genesis_hash) const {
        return readFile(cachePath(pool_name, genesis_hash));
    }

    dp::Result<void, dp::Error> GenesisStore::writeCache(const std::string &pool_name, const std::string &genesis_hash,
                                                         const std::string &transactions) {
        return writeSafe(cachePath(pool_name, genesis_hash), transactions);
    }

    dp::Result<void, dp::Error> GenesisStore::writeSafe(const std::filesystem::path &path, const std::string &content) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return dp::Result<void, dp::Error>::err(dp::Error::io_error(dp::String(ec.message().c_str())));
        }

        std::random_device rd;
        auto tmp = path;
        tmp += ".tmp" + std::to_string(rd());
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) {
                return dp::Result<void, dp::Error>::err(dp::Error::io_error("Cannot create temporary file"));
            }
            out << content;
            if (!out) {
                return dp::Result<void, dp::Error>::err(dp::Error::io_error("Cannot write temporary file"));
            }
        }

        std::filesystem::rename(tmp, path, ec);
        if (ec) {
            std::filesystem::remove(tmp, ec);
            return dp::Result<void, dp::Error>::err(dp::Error::io_error("Cannot replace target file"));
        }
        return dp::Result<void, dp::Error>::ok();
    }

} // namespace resolvit::ledger
