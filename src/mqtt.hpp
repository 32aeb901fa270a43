#pragma once
#include <string>
#include <functional>
#include <mosquitto.h>

/**
 * Publishes to the broker and delivers messages from the bacnet-in/# topics.
 *
 * Inbound messages arrive on the thread mosquitto_subscribe_callback runs on,
 * the callback must hand them over to the owner of the BACnet stack. That
 * thread is detached and outlives the handler.
 */
class MessageHandler {
public:
    using message_callback = std::function<void(const std::string&, const std::string&)>;

    MessageHandler(const std::string& host, const int port);
    ~MessageHandler();

    MessageHandler(const MessageHandler&) = delete;
    MessageHandler& operator=(const MessageHandler&) = delete;

    bool connected() const { return _connected; }
    static int call_back_func(struct mosquitto *mosq, void *userdata, const struct mosquitto_message *msg);
    int pub_message(const std::string& topic, const std::string& message);
    static void add_callback(message_callback callback);

private:
    struct mosquitto* _mosq = nullptr;
    std::string _host;
    int _port;
    int _keep_alive = 60;
    bool _connected = false;
    void init_();
};
