#include "callguard/escalation/channels.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>
#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>

#include "callguard/logging.hpp"
#include "callguard/utils/http.hpp"

namespace callguard::escalation {

namespace {

using WsClient = websocketpp::client<websocketpp::config::asio_client>;

constexpr std::chrono::seconds kReconnectMin{1};
constexpr std::chrono::seconds kReconnectMax{60};

nlohmann::json envelope(const std::string& recipient, const std::string& payload) {
    nlohmann::json notification = nlohmann::json::parse(payload, nullptr, false);
    if (notification.is_discarded()) {
        notification = payload;
    }
    return {{"recipient", recipient}, {"notification", notification}};
}

}

SendResult LogChannel::send(const std::string& recipient, const std::string& payload) {
    logging::warn("Escalation notification", {kv("recipient", recipient), kv("payload", payload)});
    return SendResult::success();
}

WebhookChannel::WebhookChannel(std::string url,
                               std::optional<std::string> bearer_token,
                               std::chrono::seconds timeout)
    : url_(std::move(url)), bearer_token_(std::move(bearer_token)), timeout_(timeout) {}

SendResult WebhookChannel::send(const std::string& recipient, const std::string& payload) {
    const auto result =
        utils::post_json(url_, envelope(recipient, payload).dump(), bearer_token_, timeout_);
    if (result.ok()) {
        return SendResult::success();
    }
    if (!result.error.empty()) {
        return SendResult::failure(result.error);
    }
    return SendResult::failure("webhook responded " + std::to_string(result.status));
}

struct WebSocketChannel::WsState {
    std::shared_ptr<WsClient> client;
    websocketpp::connection_hdl connection;
};

WebSocketChannel::WebSocketChannel(std::string url) : url_(std::move(url)) {}

WebSocketChannel::~WebSocketChannel() {
    stop();
}

void WebSocketChannel::start() {
    if (running_) {
        return;
    }
    running_ = true;
    worker_ = std::thread([this]() { run_loop(); });
}

void WebSocketChannel::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    {
        std::lock_guard<std::mutex> lock(ws_mutex_);
        if (ws_state_ && ws_state_->client) {
            websocketpp::lib::error_code ec;
            if (!ws_state_->connection.expired()) {
                ws_state_->client->close(ws_state_->connection,
                                         websocketpp::close::status::going_away,
                                         "shutdown", ec);
            }
            ws_state_->client->stop();
        }
    }
    if (worker_.joinable()) {
        worker_.join();
    }
}

SendResult WebSocketChannel::send(const std::string& recipient, const std::string& payload) {
    std::lock_guard<std::mutex> lock(ws_mutex_);
    if (!connected_ || !ws_state_ || !ws_state_->client || ws_state_->connection.expired()) {
        return SendResult::failure("websocket not connected: " + url_);
    }
    websocketpp::lib::error_code ec;
    ws_state_->client->send(ws_state_->connection, envelope(recipient, payload).dump(),
                            websocketpp::frame::opcode::text, ec);
    if (ec) {
        return SendResult::failure(ec.message());
    }
    return SendResult::success();
}

void WebSocketChannel::run_loop() {
    auto delay = kReconnectMin;
    while (running_) {
        auto client = std::make_shared<WsClient>();
        client->clear_access_channels(websocketpp::log::alevel::all);
        client->clear_error_channels(websocketpp::log::elevel::all);
        client->init_asio();

        // Handlers run on this thread inside client->run().
        client->set_open_handler([this, &delay](websocketpp::connection_hdl) {
            connected_ = true;
            delay = kReconnectMin;
            logging::info("Notification websocket connected", {kv("url", url_)});
        });
        client->set_close_handler([this](websocketpp::connection_hdl) {
            connected_ = false;
            logging::warn("Notification websocket closed", {kv("url", url_)});
        });
        client->set_fail_handler([this](websocketpp::connection_hdl) {
            connected_ = false;
            logging::warn("Notification websocket connect failed", {kv("url", url_)});
        });

        websocketpp::lib::error_code ec;
        auto conn = client->get_connection(url_, ec);
        if (!ec) {
            {
                std::lock_guard<std::mutex> lock(ws_mutex_);
                ws_state_ = std::make_unique<WsState>();
                ws_state_->client = client;
                ws_state_->connection = conn->get_handle();
            }
            client->connect(conn);
            client->run();
            connected_ = false;
            std::lock_guard<std::mutex> lock(ws_mutex_);
            ws_state_.reset();
        } else {
            logging::error("Invalid notification websocket url",
                           {kv("url", url_), kv("error", ec.message())});
        }

        if (!running_) {
            break;
        }
        logging::debug("Notification websocket reconnecting",
                       {kv("url", url_), kv("delay_sec", delay.count())});
        std::this_thread::sleep_for(delay);
        delay = std::min(delay * 2, kReconnectMax);
    }
}

void ChannelRegistry::add(std::shared_ptr<NotificationChannel> channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto name = channel->name();
    channels_[name] = std::move(channel);
}

std::shared_ptr<NotificationChannel> ChannelRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(name);
    if (it == channels_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::string> ChannelRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& entry : channels_) {
        names.push_back(entry.first);
    }
    return names;
}

}
