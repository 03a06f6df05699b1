/**
 * @file main.cpp
 * @brief D-Bus system service helper for FloppyForge
 *
 * This privileged helper runs as root and exposes the transfer commands
 * (StartWrite, StartFormat, StartVerify, Cancel) on the system bus. Job
 * events are re-emitted as D-Bus signals from the main loop.
 *
 * Authorization is handled via polkit.
 */

#include "services/AppConfig.hpp"
#include "services/TransferService.hpp"
#include "util/Logger.hpp"

#include <gio/gio.h>
#include <polkit/polkit.h>

#include <unistd.h>

#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace {

// D-Bus interface name and object path
constexpr auto DBUS_NAME = "org.floppyforge.Helper";
constexpr auto DBUS_PATH = "/org/floppyforge/Helper";
constexpr auto DBUS_INTERFACE = "org.floppyforge.Helper";

// Polkit action IDs
constexpr auto POLKIT_ACTION_WRITE_DEVICE = "org.floppyforge.write-device";
constexpr auto POLKIT_ACTION_VERIFY_DEVICE = "org.floppyforge.verify-device";

constexpr auto HELPER_LOG_DIR = "/var/log/floppyforge";

// Global state
GDBusConnection* g_connection = nullptr;
GMainLoop* g_main_loop = nullptr;
std::unique_ptr<TransferService> g_transfer_service;

// D-Bus introspection XML
const char* introspection_xml = R"XML(
<node>
  <interface name="org.floppyforge.Helper">
    <method name="StartWrite">
      <arg name="image_path" type="s" direction="in"/>
      <arg name="device_path" type="s" direction="in"/>
      <arg name="started" type="b" direction="out"/>
      <arg name="job_id" type="t" direction="out"/>
      <arg name="error_message" type="s" direction="out"/>
    </method>
    <method name="StartFormat">
      <arg name="device_path" type="s" direction="in"/>
      <arg name="started" type="b" direction="out"/>
      <arg name="job_id" type="t" direction="out"/>
      <arg name="error_message" type="s" direction="out"/>
    </method>
    <method name="StartVerify">
      <arg name="image_path" type="s" direction="in"/>
      <arg name="device_path" type="s" direction="in"/>
      <arg name="started" type="b" direction="out"/>
      <arg name="job_id" type="t" direction="out"/>
      <arg name="error_message" type="s" direction="out"/>
    </method>
    <method name="Cancel">
      <arg name="job_id" type="t" direction="in"/>
      <arg name="cancelled" type="b" direction="out"/>
    </method>
    <method name="GetJobState">
      <arg name="job_id" type="t" direction="in"/>
      <arg name="state" type="s" direction="out"/>
    </method>
    <signal name="Started">
      <arg name="job_id" type="t"/>
      <arg name="mode" type="s"/>
      <arg name="bytes_total" type="t"/>
    </signal>
    <signal name="Progress">
      <arg name="job_id" type="t"/>
      <arg name="bytes_done" type="t"/>
      <arg name="bytes_total" type="t"/>
      <arg name="rate_bps" type="t"/>
      <arg name="eta_seconds" type="x"/>
      <arg name="percentage" type="d"/>
      <arg name="verifying" type="b"/>
      <arg name="bytes_verified" type="t"/>
    </signal>
    <signal name="LogLine">
      <arg name="job_id" type="t"/>
      <arg name="severity" type="s"/>
      <arg name="text" type="s"/>
    </signal>
    <signal name="Finished">
      <arg name="job_id" type="t"/>
      <arg name="status" type="s"/>
      <arg name="error_kind" type="s"/>
      <arg name="error_offset" type="t"/>
      <arg name="error_message" type="s"/>
      <arg name="bytes_done" type="t"/>
    </signal>
  </interface>
</node>
)XML";

auto severity_name(LogSeverity severity) -> const char* {
    switch (severity) {
        case LogSeverity::INFO:
            return "info";
        case LogSeverity::WARNING:
            return "warn";
        case LogSeverity::ERROR:
            return "err";
        case LogSeverity::OK:
            return "ok";
    }
    return "info";
}

/**
 * Check polkit authorization for the calling process
 */
auto check_authorization(GDBusMethodInvocation* invocation, const char* action_id) -> bool {
    GError* error = nullptr;

    const char* sender = g_dbus_method_invocation_get_sender(invocation);
    if (!sender) {
        g_dbus_method_invocation_return_error(invocation, G_DBUS_ERROR, G_DBUS_ERROR_AUTH_FAILED,
                                              "Could not determine caller");
        return false;
    }

    PolkitAuthority* authority = polkit_authority_get_sync(nullptr, &error);
    if (!authority) {
        g_dbus_method_invocation_return_error(invocation, G_DBUS_ERROR, G_DBUS_ERROR_AUTH_FAILED,
                                              "Could not get polkit authority: %s",
                                              error ? error->message : "unknown error");
        g_clear_error(&error);
        return false;
    }

    PolkitSubject* subject = polkit_system_bus_name_new(sender);

    PolkitAuthorizationResult* result = polkit_authority_check_authorization_sync(
        authority, subject, action_id,
        nullptr,  // details
        POLKIT_CHECK_AUTHORIZATION_FLAGS_ALLOW_USER_INTERACTION,
        nullptr,  // cancellable
        &error);

    g_object_unref(subject);
    g_object_unref(authority);

    if (!result) {
        g_dbus_method_invocation_return_error(invocation, G_DBUS_ERROR, G_DBUS_ERROR_AUTH_FAILED,
                                              "Authorization check failed: %s",
                                              error ? error->message : "unknown error");
        g_clear_error(&error);
        return false;
    }

    bool authorized = polkit_authorization_result_get_is_authorized(result);
    g_object_unref(result);

    if (!authorized) {
        LOG_WARNING("Helper", std::format("{} denied {}", sender, action_id));
        g_dbus_method_invocation_return_error(invocation, G_DBUS_ERROR, G_DBUS_ERROR_ACCESS_DENIED,
                                              "Not authorized for action: %s", action_id);
        return false;
    }

    return true;
}

/**
 * Build the signal name and arguments for one transfer event
 */
auto to_signal(const TransferEvent& event) -> std::pair<const char*, GVariant*> {
    if (const auto* started = std::get_if<StartedEvent>(&event)) {
        return {"Started", g_variant_new("(tst)", static_cast<guint64>(started->job_id),
                                         std::string(to_string(started->mode)).c_str(),
                                         static_cast<guint64>(started->bytes_total))};
    }
    if (const auto* progress = std::get_if<ProgressEvent>(&event)) {
        return {"Progress",
                g_variant_new("(ttttxdbt)", static_cast<guint64>(progress->job_id),
                              static_cast<guint64>(progress->bytes_done),
                              static_cast<guint64>(progress->bytes_total),
                              static_cast<guint64>(progress->rate_bps),
                              static_cast<gint64>(progress->eta_seconds), progress->percentage,
                              progress->verifying ? TRUE : FALSE,
                              static_cast<guint64>(progress->bytes_verified))};
    }
    if (const auto* line = std::get_if<LogLineEvent>(&event)) {
        return {"LogLine", g_variant_new("(tss)", static_cast<guint64>(line->job_id),
                                         severity_name(line->severity), line->text.c_str())};
    }

    const auto& finished = std::get<FinishedEvent>(event);
    const auto& result = finished.result;
    const std::string status{to_string(result.status)};
    const std::string kind = result.error ? std::string(to_string(result.error->kind)) : "";
    return {"Finished",
            g_variant_new("(tsstst)", static_cast<guint64>(finished.job_id), status.c_str(),
                          kind.c_str(),
                          static_cast<guint64>(result.error ? result.error->offset : 0),
                          result.error ? result.error->message.c_str() : "",
                          static_cast<guint64>(result.bytes_done))};
}

/**
 * Emit a transfer event as a D-Bus signal (main thread only)
 */
void emit_event(const TransferEvent& event) {
    if (!g_connection) return;

    auto [name, parameters] = to_signal(event);

    GError* error = nullptr;
    g_dbus_connection_emit_signal(g_connection,
                                  nullptr,  // broadcast to all
                                  DBUS_PATH, DBUS_INTERFACE, name, parameters, &error);

    if (error) {
        LOG_ERROR("Helper", std::format("Failed to emit {}: {}", name, error->message));
        g_error_free(error);
    }
}

/**
 * Reply to a Start* call with (bts)
 */
void return_start_result(GDBusMethodInvocation* invocation,
                         const std::expected<uint64_t, TransferError>& job) {
    if (job) {
        g_dbus_method_invocation_return_value(
            invocation, g_variant_new("(bts)", TRUE, static_cast<guint64>(*job), ""));
        return;
    }
    const auto message = std::format("{}: {}", to_string(job.error().kind), job.error().message);
    g_dbus_method_invocation_return_value(
        invocation, g_variant_new("(bts)", FALSE, static_cast<guint64>(0), message.c_str()));
}

/**
 * Handle StartWrite method call
 */
void handle_start_write(GDBusMethodInvocation* invocation, GVariant* parameters) {
    if (!check_authorization(invocation, POLKIT_ACTION_WRITE_DEVICE)) {
        return;
    }

    const char* image_path = nullptr;
    const char* device_path = nullptr;
    g_variant_get(parameters, "(&s&s)", &image_path, &device_path);

    return_start_result(invocation, g_transfer_service->start_write(image_path ? image_path : "",
                                                                    device_path ? device_path : ""));
}

/**
 * Handle StartFormat method call
 */
void handle_start_format(GDBusMethodInvocation* invocation, GVariant* parameters) {
    if (!check_authorization(invocation, POLKIT_ACTION_WRITE_DEVICE)) {
        return;
    }

    const char* device_path = nullptr;
    g_variant_get(parameters, "(&s)", &device_path);

    return_start_result(invocation, g_transfer_service->start_format(device_path ? device_path : ""));
}

/**
 * Handle StartVerify method call
 */
void handle_start_verify(GDBusMethodInvocation* invocation, GVariant* parameters) {
    if (!check_authorization(invocation, POLKIT_ACTION_VERIFY_DEVICE)) {
        return;
    }

    const char* image_path = nullptr;
    const char* device_path = nullptr;
    g_variant_get(parameters, "(&s&s)", &image_path, &device_path);

    return_start_result(invocation, g_transfer_service->start_verify(image_path ? image_path : "",
                                                                     device_path ? device_path : ""));
}

/**
 * Handle Cancel method call
 */
void handle_cancel(GDBusMethodInvocation* invocation, GVariant* parameters) {
    if (!check_authorization(invocation, POLKIT_ACTION_WRITE_DEVICE)) {
        return;
    }

    guint64 job_id = 0;
    g_variant_get(parameters, "(t)", &job_id);

    bool cancelled = g_transfer_service->cancel(job_id);

    g_dbus_method_invocation_return_value(invocation,
                                          g_variant_new("(b)", cancelled ? TRUE : FALSE));
}

/**
 * Handle GetJobState method call
 */
void handle_get_job_state(GDBusMethodInvocation* invocation, GVariant* parameters) {
    guint64 job_id = 0;
    g_variant_get(parameters, "(t)", &job_id);

    auto state = g_transfer_service->job_state(job_id);
    const std::string name = state ? std::string(to_string(*state)) : "unknown";

    g_dbus_method_invocation_return_value(invocation, g_variant_new("(s)", name.c_str()));
}

/**
 * D-Bus method call handler
 */
void handle_method_call(GDBusConnection* /*connection*/, const gchar* /*sender*/,
                        const gchar* /*object_path*/, const gchar* /*interface_name*/,
                        const gchar* method_name, GVariant* parameters,
                        GDBusMethodInvocation* invocation, gpointer /*user_data*/) {
    if (g_strcmp0(method_name, "StartWrite") == 0) {
        handle_start_write(invocation, parameters);
    } else if (g_strcmp0(method_name, "StartFormat") == 0) {
        handle_start_format(invocation, parameters);
    } else if (g_strcmp0(method_name, "StartVerify") == 0) {
        handle_start_verify(invocation, parameters);
    } else if (g_strcmp0(method_name, "Cancel") == 0) {
        handle_cancel(invocation, parameters);
    } else if (g_strcmp0(method_name, "GetJobState") == 0) {
        handle_get_job_state(invocation, parameters);
    } else {
        g_dbus_method_invocation_return_error(invocation, G_DBUS_ERROR,
                                              G_DBUS_ERROR_UNKNOWN_METHOD, "Unknown method: %s",
                                              method_name);
    }
}

// D-Bus interface vtable
const GDBusInterfaceVTable interface_vtable = {
    .method_call = handle_method_call,
    .get_property = nullptr,
    .set_property = nullptr,
    .padding = {nullptr, nullptr, nullptr, nullptr, nullptr, nullptr, nullptr, nullptr}};

/**
 * Callback when D-Bus name is acquired
 */
void on_name_acquired(GDBusConnection* connection, const gchar* name, gpointer /*user_data*/) {
    LOG_INFO("Helper", std::format("Acquired D-Bus name {}", name));
    g_connection = connection;

    GError* error = nullptr;
    GDBusNodeInfo* introspection_data = g_dbus_node_info_new_for_xml(introspection_xml, &error);

    if (!introspection_data) {
        LOG_ERROR("Helper", std::format("Failed to parse introspection XML: {}",
                                        error ? error->message : "unknown"));
        g_clear_error(&error);
        g_main_loop_quit(g_main_loop);
        return;
    }

    guint registration_id = g_dbus_connection_register_object(
        connection, DBUS_PATH, introspection_data->interfaces[0], &interface_vtable,
        nullptr,  // user_data
        nullptr,  // user_data_free_func
        &error);

    g_dbus_node_info_unref(introspection_data);

    if (registration_id == 0) {
        LOG_ERROR("Helper", std::format("Failed to register object: {}",
                                        error ? error->message : "unknown"));
        g_clear_error(&error);
        g_main_loop_quit(g_main_loop);
        return;
    }

    LOG_INFO("Helper", std::format("D-Bus object registered at {}", DBUS_PATH));
}

/**
 * Callback when D-Bus name is lost
 */
void on_name_lost(GDBusConnection* /*connection*/, const gchar* name, gpointer /*user_data*/) {
    LOG_ERROR("Helper", std::format("Lost D-Bus name {}", name ? name : DBUS_NAME));
    g_main_loop_quit(g_main_loop);
}

}  // namespace

int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    if (getuid() != 0) {
        std::cerr << "Error: This helper must run as root" << std::endl;
        return 1;
    }

    auto config = AppConfig::load();
    if (!config) {
        std::cerr << "Error: " << config.error().message << std::endl;
        return 1;
    }

    auto& logger = util::Logger::instance();
    logger.set_console_output(true);
    const auto log_dir =
        config->log_directory.empty() ? std::filesystem::path{HELPER_LOG_DIR} : config->log_directory;
    if (!logger.initialize(log_dir, "floppyforge-helper", config->log_level)) {
        std::cerr << "Warning: cannot write log files to " << log_dir.string() << std::endl;
    }
    LOG_INFO("Helper", "FloppyForge helper starting");

    // Events are only pushed out as signals, never polled
    auto service_options = config->service;
    service_options.buffer_events = false;
    g_transfer_service = std::make_unique<TransferService>(service_options);

    g_transfer_service->events().subscribe([](const TransferEvent& event) {
        // Worker thread: schedule signal emission on main thread
        auto* event_copy = new TransferEvent(event);
        g_idle_add(
            [](gpointer data) -> gboolean {
                std::unique_ptr<TransferEvent> event{static_cast<TransferEvent*>(data)};
                emit_event(*event);
                return G_SOURCE_REMOVE;
            },
            event_copy);
    });

    g_main_loop = g_main_loop_new(nullptr, FALSE);

    guint owner_id = g_bus_own_name(G_BUS_TYPE_SYSTEM, DBUS_NAME, G_BUS_NAME_OWNER_FLAGS_NONE,
                                    nullptr,  // bus_acquired
                                    on_name_acquired, on_name_lost,
                                    nullptr,  // user_data
                                    nullptr   // user_data_free_func
    );

    g_main_loop_run(g_main_loop);

    g_bus_unown_name(owner_id);
    // Cancels and joins every worker
    g_transfer_service.reset();
    g_main_loop_unref(g_main_loop);

    LOG_INFO("Helper", "FloppyForge helper stopped");
    logger.shutdown();
    return 0;
}
