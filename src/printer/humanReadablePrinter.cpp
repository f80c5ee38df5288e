/**
 * @file
 * @brief Tabular printer of resource objects
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <api/labels.hpp>
#include <common/error.hpp>
#include <common/logger.hpp>
#include <common/tabWriter.hpp>

#include <printer/humanReadablePrinter.hpp>

namespace resprint {
namespace printer {

static constexpr size_t TABLE_MIN_WIDTH = 20;
static constexpr size_t TABLE_TAB_WIDTH = 5;
static constexpr size_t TABLE_PADDING = 3;
static constexpr char TABLE_PAD_CHAR = ' ';

static const std::vector<std::string> g_pod_columns {"NAME", "IMAGE(S)", "HOST", "LABELS", "STATUS"};
static const std::vector<std::string> g_controller_columns {"NAME", "IMAGE(S)", "SELECTOR", "REPLICAS"};
static const std::vector<std::string> g_service_columns {"NAME", "LABELS", "SELECTOR", "IP", "PORT"};
static const std::vector<std::string> g_minion_columns {"NAME"};
static const std::vector<std::string> g_status_columns {"STATUS"};
static const std::vector<std::string> g_event_columns {"NAME", "KIND", "STATUS", "REASON", "MESSAGE"};

static void
write_row(std::ostream &output, const std::vector<std::string> &cells)
{
    output << string_join(cells, "\t") << '\n';
    if (!output) {
        throw WriteError("failed to write table row");
    }
}

static std::string
image_list(const api::PodSpec &spec)
{
    std::vector<std::string> images;

    for (const auto &container : spec.containers) {
        images.push_back(container.image);
    }
    return string_join(images, ",");
}

static std::string
pod_host(const api::PodStatus &status)
{
    if (status.host.empty() && status.host_ip.empty()) {
        return "<unassigned>";
    }
    return status.host + "/" + status.host_ip;
}

static void
print_pod(const api::Pod &pod, std::ostream &output)
{
    write_row(output, {
        pod.metadata.name,
        image_list(pod.spec),
        pod_host(pod.status),
        api::labels::to_string(pod.metadata.labels),
        pod.status.phase,
    });
}

static void
print_controller(const api::ReplicationController &controller, std::ostream &output)
{
    write_row(output, {
        controller.metadata.name,
        image_list(controller.spec.pod_template.spec),
        api::labels::to_string(controller.spec.selector),
        std::to_string(controller.spec.replicas),
    });
}

static void
print_service(const api::Service &service, std::ostream &output)
{
    write_row(output, {
        service.metadata.name,
        api::labels::to_string(service.metadata.labels),
        api::labels::to_string(service.spec.selector),
        service.spec.portal_ip,
        std::to_string(service.spec.port),
    });
}

static void
print_minion(const api::Minion &minion, std::ostream &output)
{
    write_row(output, {minion.metadata.name});
}

static void
print_status(const api::Status &status, std::ostream &output)
{
    write_row(output, {status.status});
}

static void
print_event(const api::Event &event, std::ostream &output)
{
    write_row(output, {
        event.involved_object.name,
        event.involved_object.kind,
        event.status,
        event.reason,
        event.message,
    });
}

HumanReadablePrinter::HumanReadablePrinter(bool no_headers)
    : m_no_headers(no_headers)
{
    add_default_handlers();
}

void
HumanReadablePrinter::add_default_handlers()
{
    handler(g_pod_columns, print_pod);
    handler(g_pod_columns, detail::print_each<api::PodList>(print_pod));
    handler(g_controller_columns, print_controller);
    handler(g_controller_columns, detail::print_each<api::ReplicationControllerList>(print_controller));
    handler(g_service_columns, print_service);
    handler(g_service_columns, detail::print_each<api::ServiceList>(print_service));
    handler(g_minion_columns, print_minion);
    handler(g_minion_columns, detail::print_each<api::MinionList>(print_minion));
    handler(g_status_columns, print_status);
    handler(g_event_columns, print_event);
    handler(g_event_columns, detail::print_each<api::EventList>(print_event));
}

void
HumanReadablePrinter::add_handler(
    std::type_index type,
    std::type_index header_type,
    const std::vector<std::string> &columns,
    PrintFn print_fn)
{
    auto it = m_handlers.find(type);

    if (it != m_handlers.end()) {
        LOG_DEBUG << "Replacing print handler of " << type.name();
        it->second = Handler {header_type, columns, std::move(print_fn)};
        return;
    }

    m_handlers.emplace(type, Handler {header_type, columns, std::move(print_fn)});
}

void
HumanReadablePrinter::reject_handler(const std::string &reason)
{
    LOG_WARNING << "Invalid print handler: " << reason;
    throw MalformedHandler("invalid print handler: {}", reason);
}

bool
HumanReadablePrinter::has_handler(std::type_index type) const
{
    return m_handlers.find(type) != m_handlers.end();
}

void
HumanReadablePrinter::print_obj(const api::Object &obj, std::ostream &output)
{
    TabWriter writer {output, TABLE_MIN_WIDTH, TABLE_TAB_WIDTH, TABLE_PADDING, TABLE_PAD_CHAR};
    const std::type_index type {typeid(obj)};

    auto it = m_handlers.find(type);
    if (it == m_handlers.end()) {
        throw UnknownTypeError("unknown type {}", obj.kind());
    }

    const Handler &entry = it->second;

    if (!m_no_headers && m_last_type != entry.header_type) {
        write_row(writer.stream(), entry.columns);
        m_last_type = entry.header_type;
    }

    entry.print_fn(obj, writer.stream());
    writer.flush();
}

} // printer
} // resprint
