#include <dhtexpo/network/metrics_http_server.hpp>
#include <dhtexpo/config/config.hpp>
#include <dhtexpo/config/settings.hpp>
#include <dhtexpo/exposition/prometheus_format.hpp>
#include <dhtexpo/utils/logger.hpp>
#include <lwip/sockets.h>

static const char* TAG_HTTP = "MetricsHttp";

MetricsHttpServer::MetricsHttpServer(const MetricsStore& store)
    : store(store),
      server(nullptr),
      bind_addr(0),
      scrapes(0) {}

MetricsHttpServer::~MetricsHttpServer() {
    stop();
}

bool MetricsHttpServer::start(const char* addr, uint16_t port) {
    if (server != nullptr) {
        return true;
    }
    if (!parseIpv4(addr, bind_addr)) {
        LOG_ERROR(TAG_HTTP, "Invalid bind address '%s'", addr);
        return false;
    }

    httpd_config_t config = HTTPD_DEFAULT_CONFIG();
    config.server_port = port;
    config.stack_size = Config::Http::server_stack_bytes;
    config.lru_purge_enable = true;

    esp_err_t err = httpd_start(&server, &config);
    if (err != ESP_OK) {
        LOG_ERROR(TAG_HTTP, "httpd_start on port %u failed: %s", static_cast<unsigned>(port), esp_err_to_name(err));
        server = nullptr;
        return false;
    }

    httpd_uri_t metrics_uri = {};
    metrics_uri.uri = Config::Http::metrics_uri;
    metrics_uri.method = HTTP_GET;
    metrics_uri.handler = &MetricsHttpServer::handleMetrics;
    metrics_uri.user_ctx = this;
    err = httpd_register_uri_handler(server, &metrics_uri);
    if (err != ESP_OK) {
        LOG_ERROR(TAG_HTTP, "Registering %s failed: %s", Config::Http::metrics_uri, esp_err_to_name(err));
        stop();
        return false;
    }

    LOG_INFO(TAG_HTTP, "Listening on %s:%u%s", addr, static_cast<unsigned>(port), Config::Http::metrics_uri);
    return true;
}

void MetricsHttpServer::stop() {
    if (server == nullptr) {
        return;
    }
    esp_err_t err = httpd_stop(server);
    if (err != ESP_OK) {
        LOG_WARN(TAG_HTTP, "httpd_stop failed: %s", esp_err_to_name(err));
    }
    server = nullptr;
}

bool MetricsHttpServer::acceptsLocalAddress(httpd_req_t* req) const {
    if (bind_addr == 0) {
        return true;
    }
    struct sockaddr_storage local = {};
    socklen_t len = sizeof(local);
    if (getsockname(httpd_req_to_sockfd(req), reinterpret_cast<struct sockaddr*>(&local), &len) != 0) {
        return false;
    }
    if (local.ss_family != AF_INET) {
        return false;
    }
    const struct sockaddr_in* in = reinterpret_cast<const struct sockaddr_in*>(&local);
    return ntohl(in->sin_addr.s_addr) == bind_addr;
}

esp_err_t MetricsHttpServer::handleMetrics(httpd_req_t* req) {
    MetricsHttpServer* self = static_cast<MetricsHttpServer*>(req->user_ctx);
    if (!self->acceptsLocalAddress(req)) {
        return httpd_resp_send_err(req, HTTPD_404_NOT_FOUND, nullptr);
    }

    // Handlers run one at a time on the server task
    static char body[Config::Http::response_buffer_bytes];
    const MetricsSnapshot snapshot = self->store.snapshot();
    if (!PrometheusFormat::render(snapshot, body, sizeof(body))) {
        LOG_ERROR(TAG_HTTP, "%s", "Exposition does not fit the response buffer");
        return httpd_resp_send_err(req, HTTPD_500_INTERNAL_SERVER_ERROR, "render failed");
    }

    ++self->scrapes;
    LOG_DEBUG(TAG_HTTP, "Scrape #%lu", static_cast<unsigned long>(self->scrapes));

    esp_err_t err = httpd_resp_set_type(req, Config::Http::content_type);
    if (err != ESP_OK) {
        return err;
    }
    return httpd_resp_sendstr(req, body);
}
