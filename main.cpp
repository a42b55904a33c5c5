#include <drogon/drogon.h>
#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <map>
#include <memory>
#include <string>

#include "gateway.hpp"
#include "wasm_signer.hpp"
#include "wasmedge_module.hpp"

using namespace devproxy;

static std::string getEnv(const std::string &key, const std::string &fallback = "") {
    const char *v = std::getenv(key.c_str());
    if (!v) return fallback;
    return std::string(v);
}

static long numberOr(const std::string &s, long fallback) {
    if (s.empty()) return fallback;
    char *end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (!end || *end != '\0' || v <= 0) return fallback;
    return v;
}

static std::map<std::string, std::string> parseArgs(int argc, char **argv) {
    std::map<std::string, std::string> out;
    for (int i = 1; i < argc; i++) {
        std::string item = argv[i];
        if (item.rfind("--", 0) != 0) continue;
        auto pos = item.find('=');
        if (pos == std::string::npos) {
            out[item.substr(2)] = "true";
        } else {
            out[item.substr(2, pos - 2)] = item.substr(pos + 1);
        }
    }
    return out;
}

struct Config {
    GatewayConfig gateway;
    std::string wasmPath{"sign_bg.wasm"};
    std::string logLevel{"info"};
};

static Config loadConfig(int argc, char **argv) {
    const auto args = parseArgs(argc, argv);
    auto argOrEnv = [&](const std::string &argKey, const std::string &env, const std::string &def = "") {
        auto it = args.find(argKey);
        if (it != args.end() && !it->second.empty()) return it->second;
        std::string v = getEnv(env);
        if (!v.empty()) return v;
        return def;
    };

    Config c;
    GatewayConfig &g = c.gateway;
    g.host = argOrEnv("host", "DEVPROXY_HOST", g.host);
    g.port = (int)numberOr(argOrEnv("port", "DEVPROXY_PORT"), g.port);
    g.threads = (int)numberOr(argOrEnv("threads", "DEVPROXY_THREADS"), g.threads);
    g.defaultModel = argOrEnv("model", "DEVPROXY_DEFAULT_MODEL", g.defaultModel);
    g.jwtSecret = argOrEnv("jwt-secret", "DEVPROXY_JWT_SECRET");

    DevClientConfig &u = g.upstream;
    u.apiEndpoint = argOrEnv("api-endpoint", "API_ENDPOINT");
    u.deviceId = argOrEnv("device-id", "DEVICE_ID");
    u.osType = argOrEnv("os-type", "OS_TYPE", u.osType);
    u.sid = argOrEnv("sid", "SID");
    u.connectTimeoutMs = numberOr(argOrEnv("connect-timeout-ms", "DEVPROXY_CONNECT_TIMEOUT_MS"), u.connectTimeoutMs);
    u.idleTimeoutMs = numberOr(argOrEnv("idle-timeout-ms", "DEVPROXY_IDLE_TIMEOUT_MS"), u.idleTimeoutMs);

    c.wasmPath = argOrEnv("wasm", "DEVPROXY_SIGN_WASM", c.wasmPath);
    c.logLevel = argOrEnv("log-level", "DEVPROXY_LOG_LEVEL", c.logLevel);
    return c;
}

static trantor::Logger::LogLevel logLevelFrom(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(), ::tolower);
    if (name == "trace") return trantor::Logger::kTrace;
    if (name == "debug") return trantor::Logger::kDebug;
    if (name == "warn") return trantor::Logger::kWarn;
    if (name == "error") return trantor::Logger::kError;
    return trantor::Logger::kInfo;
}

int main(int argc, char **argv) {
    const auto config = loadConfig(argc, argv);
    drogon::app().setLogLevel(logLevelFrom(config.logLevel));

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        LOG_FATAL << "libcurl initialization failed";
        return 1;
    }
    {
        const std::string wasmPath = config.wasmPath;
        auto signer = std::make_shared<WasmSigner>([wasmPath]() { return loadWasmEdgeModule(wasmPath); });
        GatewayServer gateway(config.gateway, signer);
        gateway.listen();
    }
    curl_global_cleanup();
    return 0;
}
