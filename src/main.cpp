#include "mqtt.hpp"
#include "bacnet_stack.hpp"
#include "config.hpp"
#include "cov_ingestor.hpp"
#include "debug.hpp"
#include "device_registry.hpp"
#include "discovery.hpp"
#include "id_allocator.hpp"
#include "mqtt_bridge.hpp"
#include "request_dispatcher.hpp"
#include "task_queue.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <thread>

static std::atomic<bool> Running{true};

static void stop_handler(int signal)
{
    (void)signal;
    Running = false;
}

static void start_timer(struct mstimer *timer, unsigned seconds)
{
    if (seconds) {
        mstimer_set(timer, seconds * 1000UL);
    }
}

static bool timer_due(struct mstimer *timer)
{
    if (mstimer_interval(timer) == 0 or not mstimer_expired(timer)) {
        return false;
    }
    mstimer_reset(timer);
    return true;
}

int main(int argc, char *argv[]) {
    (void)argc;
    (void)argv;
    auto config = load_config();
    bacnet_debug_enabled = config.debug;

    MessageHandler handler(config.mqtt_host, config.mqtt_port);
    if (not handler.connected()) {
        return 1;
    }

    bacnet_stack stack(config.device_instance);
    device_registry registry;
    id_allocator ids;
    request_dispatcher dispatcher(stack, registry, ids, config.lists);
    dispatcher.set_default_lifetime(config.cov_lifetime);
    dispatcher.set_max_objects_per_read(config.max_objects_per_read);
    cov_ingestor ingestor(stack, registry, dispatcher);
    ingestor.set_disposition(config.disposition);
    ingestor.attach();
    discovery devices(stack, registry, dispatcher, config.lists);

    task_queue tasks;
    MessageHandler::add_callback([&tasks, &registry, &dispatcher, &stack](const std::string& topic, const std::string& message) {
        tasks.post([topic, message, &registry, &dispatcher, &stack] {
            auto command = parse_write_topic(topic);
            if (not command) {
                fprintf(stderr, "Ignoring message on %s\n", topic.c_str());
                return;
            }
            execute_write(*command, message, registry, dispatcher, stack);
        });
    });

    registry_publisher publisher(registry, [&handler](const std::string& topic, const std::string& payload) {
        return handler.pub_message(topic, payload);
    });
    std::thread publisher_thread([&publisher] { publisher.run(Running); });

    std::signal(SIGINT, stop_handler);
    std::signal(SIGTERM, stop_handler);

    struct mstimer who_is_timer = { 0 };
    struct mstimer refresh_timer = { 0 };
    struct mstimer subscription_timer = { 0 };
    start_timer(&who_is_timer, config.who_is_seconds);
    start_timer(&refresh_timer, config.refresh_seconds);
    mstimer_set(&subscription_timer, 5000);

    devices.start();
    while (Running) {
        stack.task();
        tasks.run_pending();
        if (timer_due(&subscription_timer)) {
            devices.renew_subscriptions(request_dispatcher::clock::now());
        }
        if (timer_due(&refresh_timer)) {
            devices.refresh_all();
        }
        if (timer_due(&who_is_timer)) {
            devices.solicit();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    MessageHandler::add_callback(nullptr);
    publisher_thread.join();
    return 0;
}
