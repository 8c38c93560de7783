#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace callguard::escalation {

struct SendResult {
    bool ok = false;
    std::string error;

    static SendResult success() { return {true, ""}; }
    static SendResult failure(std::string error) { return {false, std::move(error)}; }
};

// One delivery capability per channel type.
class NotificationChannel {
public:
    virtual ~NotificationChannel() = default;
    virtual std::string name() const = 0;
    virtual SendResult send(const std::string& recipient, const std::string& payload) = 0;
};

class LogChannel : public NotificationChannel {
public:
    std::string name() const override { return "log"; }
    SendResult send(const std::string& recipient, const std::string& payload) override;
};

// POSTs {"recipient": ..., "notification": ...} to a fixed endpoint.
class WebhookChannel : public NotificationChannel {
public:
    WebhookChannel(std::string url,
                   std::optional<std::string> bearer_token,
                   std::chrono::seconds timeout);

    std::string name() const override { return "webhook"; }
    SendResult send(const std::string& recipient, const std::string& payload) override;

private:
    std::string url_;
    std::optional<std::string> bearer_token_;
    std::chrono::seconds timeout_;
};

// Keeps one websocket connection open and reconnects in the background.
class WebSocketChannel : public NotificationChannel {
public:
    explicit WebSocketChannel(std::string url);
    ~WebSocketChannel() override;

    void start();
    void stop();

    std::string name() const override { return "websocket"; }
    SendResult send(const std::string& recipient, const std::string& payload) override;

private:
    void run_loop();

    std::string url_;
    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::thread worker_;
    std::mutex ws_mutex_;
    struct WsState;
    std::unique_ptr<WsState> ws_state_;
};

class ChannelRegistry {
public:
    void add(std::shared_ptr<NotificationChannel> channel);
    std::shared_ptr<NotificationChannel> find(const std::string& name) const;
    std::vector<std::string> names() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<NotificationChannel>> channels_;
};

}
