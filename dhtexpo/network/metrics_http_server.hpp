#ifndef METRICS_HTTP_SERVER_HPP
#define METRICS_HTTP_SERVER_HPP

#include <cstdint>
#include <esp_http_server.h>
#include <dhtexpo/state/metrics_store.hpp>

// Serves GET /metrics from a MetricsStore snapshot. Handlers run on the
// esp_http_server task and never touch the sensor.
class MetricsHttpServer {
public:
    explicit MetricsHttpServer(const MetricsStore& store);
    ~MetricsHttpServer();

    MetricsHttpServer(const MetricsHttpServer&) = delete;
    MetricsHttpServer& operator=(const MetricsHttpServer&) = delete;

    // bind_addr is dotted IPv4; "0.0.0.0" accepts requests on any address.
    // false if the listener cannot be started (e.g. port in use).
    bool start(const char* bind_addr, uint16_t port);
    void stop();

private:
    static esp_err_t handleMetrics(httpd_req_t* req);
    bool acceptsLocalAddress(httpd_req_t* req) const;

    const MetricsStore& store;
    httpd_handle_t server;
    uint32_t bind_addr;   // host byte order, 0 = any
    uint32_t scrapes;
};

#endif // METRICS_HTTP_SERVER_HPP
