#include <iostream>
#include <string>
#include <map>
#include <memory>
#include <cstring>
#include <csignal>
#include <unistd.h>
#include <curl/curl.h>
#include <microhttpd.h>
#include <nlohmann/json.hpp>
#include "../../analyzer/include/app.hpp"
#include "../../analyzer/include/util.hpp"
#include "../../../shared/cpp/security/include/log.hpp"

using json = nlohmann::json;

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

static std::unique_ptr<AnalyzerApp> g_app;
static volatile std::sig_atomic_t g_stop = 0;

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
};

static MhdResult send_response(struct MHD_Connection* conn, int status, const std::string& body, const char* ctype = "application/json") {
    struct MHD_Response* resp = MHD_create_response_from_buffer(body.size(), (void*)body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, ctype);
    MhdResult ret = MHD_queue_response(conn, status, resp);
    MHD_destroy_response(resp);
    return ret;
}

static std::map<std::string,std::string> parse_query(struct MHD_Connection* conn) {
    std::map<std::string,std::string> out;
    MHD_get_connection_values(conn, MHD_GET_ARGUMENT_KIND,
        [](void* cls, enum MHD_ValueKind, const char* key, const char* val) -> MhdResult {
            auto* m = static_cast<std::map<std::string,std::string>*>(cls);
            (*m)[key ? key : ""] = val ? val : "";
            return MHD_YES;
        }, &out);
    return out;
}

static int query_int(const std::map<std::string,std::string>& q, const char* key, int def) {
    auto it = q.find(key);
    if (it == q.end() || it->second.empty()) return def;
    return std::stoi(it->second);
}

static MhdResult error_response(struct MHD_Connection* conn, int status, const std::string& msg) {
    return send_response(conn, status, json({{"error", msg}}).dump());
}

static MhdResult handler(void* /*cls*/, struct MHD_Connection* connection, const char* url, const char* method,
                         const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}};
        *con_cls = ci;
        return MHD_YES;
    }

    if (0 == strcmp(method, MHD_HTTP_METHOD_POST)) {
        if (*upload_data_size) {
            ci->body.append(upload_data, *upload_data_size);
            *upload_data_size = 0;
            return MHD_YES;
        }
    }

    std::string path(url);
    Orchestrator& orch = *g_app->orchestrator;
    try {
        if (ci->method == "GET" && path == "/health") {
            return send_response(connection, MHD_HTTP_OK, json({{"ok", true}}).dump());
        }
        if (ci->method == "POST" && path == "/run") {
            auto q = parse_query(connection);
            int tier = query_int(q, "tier", 0);
            int batch = query_int(q, "batch", 25);
            if (!valid_tier(tier) || batch < 0) {
                return error_response(connection, MHD_HTTP_BAD_REQUEST, "tier must be 1-3 and batch non-negative");
            }
            BatchSummary s = orch.run_tier(tier, (std::size_t)batch);
            return send_response(connection, MHD_HTTP_OK, s.to_json().dump());
        }
        if (ci->method == "POST" && path == "/run-all") {
            auto q = parse_query(connection);
            int batch = query_int(q, "batch", 25);
            if (batch < 0) return error_response(connection, MHD_HTTP_BAD_REQUEST, "batch must be non-negative");
            json out = json::array();
            for (const auto& s : orch.run_all((std::size_t)batch)) out.push_back(s.to_json());
            return send_response(connection, MHD_HTTP_OK, out.dump());
        }
        if (ci->method == "GET" && path == "/status") {
            return send_response(connection, MHD_HTTP_OK, orch.status().to_json().dump());
        }
        if (ci->method == "POST" && path == "/abort") {
            bool was_running = orch.running();
            if (was_running) orch.abort("requested over HTTP");
            return send_response(connection, MHD_HTTP_OK, json({{"ok", true}, {"was_running", was_running}}).dump());
        }
        if (ci->method == "POST" && path == "/requeue") {
            auto q = parse_query(connection);
            int tier = query_int(q, "tier", 0);
            if (!valid_tier(tier)) return error_response(connection, MHD_HTTP_BAD_REQUEST, "tier must be 1-3");
            auto it = q.find("job");
            std::size_t n = orch.requeue(tier, it == q.end() ? std::string() : it->second);
            return send_response(connection, MHD_HTTP_OK, json({{"requeued", n}}).dump());
        }
        return error_response(connection, MHD_HTTP_NOT_FOUND, "not found");
    } catch (const WindowBusyError& e) {
        return error_response(connection, MHD_HTTP_CONFLICT, e.what());
    } catch (const std::invalid_argument& e) {
        return error_response(connection, MHD_HTTP_BAD_REQUEST, e.what());
    } catch (const std::out_of_range& e) {
        return error_response(connection, MHD_HTTP_BAD_REQUEST, e.what());
    } catch (const std::exception& e) {
        log_error("trigger", std::string("request failed: ") + e.what());
        return error_response(connection, MHD_HTTP_INTERNAL_SERVER_ERROR, e.what());
    }
}

static void request_completed(void* /*cls*/, struct MHD_Connection* /*connection*/, void** con_cls,
                              enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}

int main(int argc, char** argv) {
    std::string config_path = getenv_or("JOBGUARD_CONFIG", "");
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) config_path = argv[++i];
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);
    int port = 0;
    try {
        AnalyzerConfig cfg = load_config(config_path);
        port = cfg.trigger_port;
        g_app = make_app(cfg);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        curl_global_cleanup();
        return 1;
    }

    std::cout << "[trigger] Starting HTTP server on port " << port << "...\n";
    // one thread per connection so /abort and /status answer while /run blocks
    struct MHD_Daemon* d = MHD_start_daemon(MHD_USE_THREAD_PER_CONNECTION | MHD_USE_INTERNAL_POLLING_THREAD,
                                            (uint16_t)port, nullptr, nullptr, &handler, nullptr,
                                            MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                                            MHD_OPTION_END);
    if (!d) {
        std::cerr << "[trigger] Failed to start HTTP server" << std::endl;
        curl_global_cleanup();
        return 1;
    }
    std::signal(SIGTERM, [](int){ g_stop = 1; });
    std::signal(SIGINT, [](int){ g_stop = 1; });
    while (!g_stop) pause();

    std::cout << "[trigger] Stopping" << std::endl;
    if (g_app->orchestrator->running()) g_app->orchestrator->abort("shutdown");
    MHD_stop_daemon(d);
    g_app.reset();
    curl_global_cleanup();
    return 0;
}
