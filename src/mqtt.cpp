#include "mqtt.hpp"
#include "debug.hpp"
#include <cstdio>
#include <mutex>
#include <thread>

static const char *Inbound_Topics = "bacnet-in/#";

/* the subscribe thread is detached and may still deliver while main returns,
   so the callback slot is never destroyed */
struct callback_slot {
    std::mutex mutex;
    MessageHandler::message_callback callback;
};

static callback_slot& Callback_Slot() {
    static auto *slot = new callback_slot;
    return *slot;
}

MessageHandler::MessageHandler(const std::string& host, const int port)
    : _host(host)
    , _port(port)
{
    init_();
}

MessageHandler::~MessageHandler() {
    if (_mosq) {
        if (_connected) {
            mosquitto_loop_stop(_mosq, true);
            mosquitto_disconnect(_mosq);
        }
        mosquitto_destroy(_mosq);
    }
    mosquitto_lib_cleanup();
}

void MessageHandler::init_() {
    mosquitto_lib_init();

    // init publish struct
    _mosq = mosquitto_new(nullptr, true, nullptr);
    if (not _mosq) {
        fprintf(stderr, "Unable to create MQTT client\n");
        return;
    }
    int rc = mosquitto_connect(_mosq, _host.c_str(), _port, _keep_alive);
    if (rc != MOSQ_ERR_SUCCESS) {
        fprintf(stderr, "MQTT connect to %s:%d failed: %s\n", _host.c_str(), _port, mosquitto_strerror(rc));
        return;
    }
    rc = mosquitto_loop_start(_mosq);
    if (rc != MOSQ_ERR_SUCCESS) {
        fprintf(stderr, "MQTT network loop failed to start: %s\n", mosquitto_strerror(rc));
        mosquitto_disconnect(_mosq);
        return;
    }
    _connected = true;
    if (bacnet_debug_enabled) {
        fprintf(stderr, "MQTT connected to %s:%d\n", _host.c_str(), _port);
    }

    // init receive callback
    auto register_callback = [host = _host, port = _port, keep_alive = _keep_alive] {
        // returns only when the connection is lost
        int rc = mosquitto_subscribe_callback(
            &MessageHandler::call_back_func,
            NULL,
            Inbound_Topics,
            0,
            host.c_str(),
            port,
            NULL,
            keep_alive,
            true,
            NULL,
            NULL,
            NULL,
            NULL
        );
        if (rc != MOSQ_ERR_SUCCESS) {
            fprintf(stderr, "MQTT subscription to %s ended: %s\n", Inbound_Topics, mosquitto_strerror(rc));
        }
    };
    std::thread register_callback_thread(register_callback);
    register_callback_thread.detach();
}

int MessageHandler::call_back_func(struct mosquitto *mosq, void *userdata, const struct mosquitto_message *msg) {
    (void)mosq;
    (void)userdata;
    std::string message(reinterpret_cast<const char *>(msg->payload), msg->payloadlen);
    // publishers that send C strings include the terminator
    if (not message.empty() and message.back() == '\0') {
        message.pop_back();
    }
    if (bacnet_debug_enabled) {
        fprintf(stderr, "MQTT message on %s: %s\n", msg->topic, message.c_str());
    }
    auto& slot = Callback_Slot();
    std::lock_guard<std::mutex> lock(slot.mutex);
    if (slot.callback) {
        slot.callback(msg->topic, message);
    }
    // keep receiving
    return 0;
}

int MessageHandler::pub_message(const std::string& topic, const std::string& message) {
    if (not _connected) {
        return 1;
    }
    int rc = mosquitto_publish(_mosq, nullptr, topic.c_str(),
                      static_cast<int>(message.length()),
                      message.c_str(), 0, false);
    if (rc != MOSQ_ERR_SUCCESS) {
        fprintf(stderr, "MQTT publish to %s failed: %s\n", topic.c_str(), mosquitto_strerror(rc));
        return 1;
    }
    return 0;
}

void MessageHandler::add_callback(message_callback callback) {
    auto& slot = Callback_Slot();
    std::lock_guard<std::mutex> lock(slot.mutex);
    slot.callback = std::move(callback);
}
