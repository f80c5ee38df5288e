/**
 * @file
 * @brief Versioned encoding of resource objects
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <api/codec.hpp>
#include <common/error.hpp>
#include <common/logger.hpp>

#include <typeindex>
#include <typeinfo>

namespace resprint {
namespace api {

using nlohmann::json;

/** Encoded documents keep the order in which fields are added */
using Document = nlohmann::ordered_json;

/**
 * @brief Layout of API versions
 *
 * Old versions keep object metadata and most of the state directly in the
 * top-level object, newer versions split it into metadata, spec and status.
 */
enum class Layout {
    flat,
    nested,
};

static void
put_string(Document &doc, const char *key, const std::string &value)
{
    if (!value.empty()) {
        doc[key] = value;
    }
}

static void
put_labels(Document &doc, const char *key, const LabelMap &labels)
{
    if (!labels.empty()) {
        doc[key] = labels;
    }
}

static const json &
get_object(const json &doc, const char *key)
{
    static const json empty = json::object();

    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return empty;
    }
    if (!it->is_object()) {
        throw DecodingError("field \"{}\" is not an object", key);
    }
    return *it;
}

static const json &
get_array(const json &doc, const char *key)
{
    static const json empty = json::array();

    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return empty;
    }
    if (!it->is_array()) {
        throw DecodingError("field \"{}\" is not an array", key);
    }
    return *it;
}

static std::string
get_string(const json &doc, const char *key)
{
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return {};
    }
    if (!it->is_string()) {
        throw DecodingError("field \"{}\" is not a string", key);
    }
    return it->get<std::string>();
}

static int32_t
get_int(const json &doc, const char *key)
{
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return 0;
    }
    if (!it->is_number_integer()) {
        throw DecodingError("field \"{}\" is not an integer", key);
    }
    return it->get<int32_t>();
}

static LabelMap
get_labels(const json &doc, const char *key)
{
    LabelMap labels;

    for (const auto &item : get_object(doc, key).items()) {
        if (!item.value().is_string()) {
            throw DecodingError("value of label \"{}\" is not a string", item.key());
        }
        labels.emplace(item.key(), item.value().get<std::string>());
    }

    return labels;
}

class JsonCodec : public Codec {
public:
    JsonCodec(std::string version, Layout layout)
        : m_version(std::move(version)), m_layout(layout) {};

    const std::string &
    version() const override { return m_version; };

    std::string
    encode(const Object &obj) const override;

    std::unique_ptr<Object>
    decode(const json &doc) const override;

private:
    std::string m_version;
    Layout m_layout;

    void encode_object(Document &doc, const Object &obj) const;
    void encode_meta(Document &doc, const ObjectMeta &meta) const;
    void encode_list_meta(Document &doc, const ListMeta &meta) const;
    void encode_containers(Document &doc, const PodSpec &spec) const;
    void encode_pod(Document &doc, const Pod &pod) const;
    void encode_controller(Document &doc, const ReplicationController &rc) const;
    void encode_service(Document &doc, const Service &svc) const;
    void encode_minion(Document &doc, const Minion &minion) const;
    void encode_status(Document &doc, const Status &status) const;
    void encode_event(Document &doc, const Event &event) const;

    template <typename List, typename Fn>
    void encode_list(Document &doc, const List &list, Fn encode_item) const;

    ObjectMeta decode_meta(const json &doc) const;
    ListMeta decode_list_meta(const json &doc) const;
    PodSpec decode_pod_spec(const json &doc) const;
    Pod decode_pod(const json &doc) const;
    ReplicationController decode_controller(const json &doc) const;
    Service decode_service(const json &doc) const;
    Minion decode_minion(const json &doc) const;
    Status decode_status(const json &doc) const;
    Event decode_event(const json &doc) const;

    template <typename List, typename Fn>
    std::unique_ptr<Object> decode_list(const json &doc, Fn decode_item) const;
};

std::string
JsonCodec::encode(const Object &obj) const
{
    Document doc = Document::object();

    doc["kind"] = obj.kind();
    doc["apiVersion"] = m_version;
    encode_object(doc, obj);

    return doc.dump();
}

void
JsonCodec::encode_object(Document &doc, const Object &obj) const
{
    const std::type_index type {typeid(obj)};

    if (type == typeid(Pod)) {
        encode_pod(doc, static_cast<const Pod &>(obj));
    } else if (type == typeid(PodList)) {
        encode_list(doc, static_cast<const PodList &>(obj),
            [this](Document &item, const Pod &pod) { encode_pod(item, pod); });
    } else if (type == typeid(ReplicationController)) {
        encode_controller(doc, static_cast<const ReplicationController &>(obj));
    } else if (type == typeid(ReplicationControllerList)) {
        encode_list(doc, static_cast<const ReplicationControllerList &>(obj),
            [this](Document &item, const ReplicationController &rc) { encode_controller(item, rc); });
    } else if (type == typeid(Service)) {
        encode_service(doc, static_cast<const Service &>(obj));
    } else if (type == typeid(ServiceList)) {
        encode_list(doc, static_cast<const ServiceList &>(obj),
            [this](Document &item, const Service &svc) { encode_service(item, svc); });
    } else if (type == typeid(Minion)) {
        encode_minion(doc, static_cast<const Minion &>(obj));
    } else if (type == typeid(MinionList)) {
        encode_list(doc, static_cast<const MinionList &>(obj),
            [this](Document &item, const Minion &minion) { encode_minion(item, minion); });
    } else if (type == typeid(Status)) {
        encode_status(doc, static_cast<const Status &>(obj));
    } else if (type == typeid(Event)) {
        encode_event(doc, static_cast<const Event &>(obj));
    } else if (type == typeid(EventList)) {
        encode_list(doc, static_cast<const EventList &>(obj),
            [this](Document &item, const Event &event) { encode_event(item, event); });
    } else {
        throw EncodingError("no kind \"{}\" is registered for version \"{}\"", obj.kind(), m_version);
    }
}

void
JsonCodec::encode_meta(Document &doc, const ObjectMeta &meta) const
{
    if (m_layout == Layout::flat) {
        put_string(doc, "id", meta.name);
        put_string(doc, "namespace", meta.ns);
        put_string(doc, "uid", meta.uid);
        put_string(doc, "creationTimestamp", meta.creation_timestamp);
        put_labels(doc, "labels", meta.labels);
        return;
    }

    Document metadata = Document::object();
    put_string(metadata, "name", meta.name);
    put_string(metadata, "namespace", meta.ns);
    put_string(metadata, "uid", meta.uid);
    put_string(metadata, "creationTimestamp", meta.creation_timestamp);
    put_labels(metadata, "labels", meta.labels);
    doc["metadata"] = std::move(metadata);
}

void
JsonCodec::encode_list_meta(Document &doc, const ListMeta &meta) const
{
    if (m_layout == Layout::flat) {
        put_string(doc, "selfLink", meta.self_link);
        put_string(doc, "resourceVersion", meta.resource_version);
        return;
    }

    Document metadata = Document::object();
    put_string(metadata, "selfLink", meta.self_link);
    put_string(metadata, "resourceVersion", meta.resource_version);
    doc["metadata"] = std::move(metadata);
}

void
JsonCodec::encode_containers(Document &doc, const PodSpec &spec) const
{
    Document containers = Document::array();

    for (const auto &container : spec.containers) {
        Document item = Document::object();
        put_string(item, "name", container.name);
        put_string(item, "image", container.image);
        containers.push_back(std::move(item));
    }

    doc["containers"] = std::move(containers);
    put_string(doc, "restartPolicy", spec.restart_policy);
}

void
JsonCodec::encode_pod(Document &doc, const Pod &pod) const
{
    Document state = Document::object();
    const char *state_key;
    const char *phase_key;

    encode_meta(doc, pod.metadata);

    if (m_layout == Layout::flat) {
        Document manifest = Document::object();
        manifest["version"] = m_version;
        encode_containers(manifest, pod.spec);
        doc["desiredState"] = Document {{"manifest", std::move(manifest)}};
        state_key = "currentState";
        phase_key = "status";
    } else {
        Document spec = Document::object();
        encode_containers(spec, pod.spec);
        doc["spec"] = std::move(spec);
        state_key = "status";
        phase_key = "phase";
    }

    put_string(state, phase_key, pod.status.phase);
    put_string(state, "host", pod.status.host);
    put_string(state, "hostIP", pod.status.host_ip);
    put_string(state, "podIP", pod.status.pod_ip);
    doc[state_key] = std::move(state);
}

void
JsonCodec::encode_controller(Document &doc, const ReplicationController &rc) const
{
    const PodTemplateSpec &tmplt = rc.spec.pod_template;
    Document pod_template = Document::object();

    encode_meta(doc, rc.metadata);

    if (m_layout == Layout::flat) {
        Document manifest = Document::object();
        manifest["version"] = m_version;
        encode_containers(manifest, tmplt.spec);
        put_labels(pod_template, "labels", tmplt.metadata.labels);
        pod_template["desiredState"] = Document {{"manifest", std::move(manifest)}};

        Document state = Document::object();
        state["replicas"] = rc.spec.replicas;
        put_labels(state, "replicaSelector", rc.spec.selector);
        state["podTemplate"] = std::move(pod_template);
        doc["desiredState"] = std::move(state);
        return;
    }

    Document pod_spec = Document::object();
    encode_meta(pod_template, tmplt.metadata);
    encode_containers(pod_spec, tmplt.spec);
    pod_template["spec"] = std::move(pod_spec);

    Document spec = Document::object();
    spec["replicas"] = rc.spec.replicas;
    put_labels(spec, "selector", rc.spec.selector);
    spec["template"] = std::move(pod_template);
    doc["spec"] = std::move(spec);
}

void
JsonCodec::encode_service(Document &doc, const Service &svc) const
{
    encode_meta(doc, svc.metadata);

    Document spec = Document::object();
    Document &target = (m_layout == Layout::flat) ? doc : spec;

    target["port"] = svc.spec.port;
    put_string(target, "protocol", svc.spec.protocol);
    put_labels(target, "selector", svc.spec.selector);
    put_string(target, "portalIP", svc.spec.portal_ip);

    if (m_layout == Layout::nested) {
        doc["spec"] = std::move(spec);
    }
}

void
JsonCodec::encode_minion(Document &doc, const Minion &minion) const
{
    encode_meta(doc, minion.metadata);

    if (m_layout == Layout::flat) {
        put_string(doc, "hostIP", minion.host_ip);
        return;
    }

    Document status = Document::object();
    put_string(status, "hostIP", minion.host_ip);
    doc["status"] = std::move(status);
}

void
JsonCodec::encode_status(Document &doc, const Status &status) const
{
    encode_list_meta(doc, status.metadata);
    put_string(doc, "status", status.status);
    put_string(doc, "message", status.message);
    put_string(doc, "reason", status.reason);
    doc["code"] = status.code;
}

void
JsonCodec::encode_event(Document &doc, const Event &event) const
{
    Document ref = Document::object();

    encode_meta(doc, event.metadata);

    put_string(ref, "kind", event.involved_object.kind);
    put_string(ref, "namespace", event.involved_object.ns);
    put_string(ref, "name", event.involved_object.name);
    put_string(ref, "uid", event.involved_object.uid);
    doc["involvedObject"] = std::move(ref);

    put_string(doc, "status", event.status);
    put_string(doc, "reason", event.reason);
    put_string(doc, "message", event.message);
    put_string(doc, "source", event.source);
}

template <typename List, typename Fn>
void
JsonCodec::encode_list(Document &doc, const List &list, Fn encode_item) const
{
    Document items = Document::array();

    encode_list_meta(doc, list.metadata);

    for (const auto &it : list.items) {
        Document item = Document::object();
        encode_item(item, it);
        items.push_back(std::move(item));
    }

    doc["items"] = std::move(items);
}

std::unique_ptr<Object>
JsonCodec::decode(const json &doc) const
{
    if (!doc.is_object()) {
        throw DecodingError("document is not an object");
    }

    const std::string kind = get_string(doc, "kind");

    if (kind == "Pod") {
        return std::unique_ptr<Object>(new Pod(decode_pod(doc)));
    } else if (kind == "PodList") {
        return decode_list<PodList>(doc, [this](const json &item) { return decode_pod(item); });
    } else if (kind == "ReplicationController") {
        return std::unique_ptr<Object>(new ReplicationController(decode_controller(doc)));
    } else if (kind == "ReplicationControllerList") {
        return decode_list<ReplicationControllerList>(doc,
            [this](const json &item) { return decode_controller(item); });
    } else if (kind == "Service") {
        return std::unique_ptr<Object>(new Service(decode_service(doc)));
    } else if (kind == "ServiceList") {
        return decode_list<ServiceList>(doc, [this](const json &item) { return decode_service(item); });
    } else if (kind == "Minion") {
        return std::unique_ptr<Object>(new Minion(decode_minion(doc)));
    } else if (kind == "MinionList") {
        return decode_list<MinionList>(doc, [this](const json &item) { return decode_minion(item); });
    } else if (kind == "Status") {
        return std::unique_ptr<Object>(new Status(decode_status(doc)));
    } else if (kind == "Event") {
        return std::unique_ptr<Object>(new Event(decode_event(doc)));
    } else if (kind == "EventList") {
        return decode_list<EventList>(doc, [this](const json &item) { return decode_event(item); });
    }

    if (kind.empty()) {
        throw DecodingError("document has no \"kind\" field");
    }
    throw DecodingError("no kind \"{}\" is registered for version \"{}\"", kind, m_version);
}

ObjectMeta
JsonCodec::decode_meta(const json &doc) const
{
    ObjectMeta meta;

    if (m_layout == Layout::flat) {
        meta.name = get_string(doc, "id");
        meta.ns = get_string(doc, "namespace");
        meta.uid = get_string(doc, "uid");
        meta.creation_timestamp = get_string(doc, "creationTimestamp");
        meta.labels = get_labels(doc, "labels");
        return meta;
    }

    const json &metadata = get_object(doc, "metadata");
    meta.name = get_string(metadata, "name");
    meta.ns = get_string(metadata, "namespace");
    meta.uid = get_string(metadata, "uid");
    meta.creation_timestamp = get_string(metadata, "creationTimestamp");
    meta.labels = get_labels(metadata, "labels");
    return meta;
}

ListMeta
JsonCodec::decode_list_meta(const json &doc) const
{
    const json &metadata = (m_layout == Layout::flat) ? doc : get_object(doc, "metadata");
    ListMeta meta;

    meta.self_link = get_string(metadata, "selfLink");
    meta.resource_version = get_string(metadata, "resourceVersion");
    return meta;
}

PodSpec
JsonCodec::decode_pod_spec(const json &doc) const
{
    PodSpec spec;

    for (const auto &item : get_array(doc, "containers")) {
        Container container;
        container.name = get_string(item, "name");
        container.image = get_string(item, "image");
        spec.containers.push_back(std::move(container));
    }

    spec.restart_policy = get_string(doc, "restartPolicy");
    return spec;
}

Pod
JsonCodec::decode_pod(const json &doc) const
{
    Pod pod;

    pod.metadata = decode_meta(doc);

    if (m_layout == Layout::flat) {
        const json &manifest = get_object(get_object(doc, "desiredState"), "manifest");
        const json &state = get_object(doc, "currentState");

        pod.spec = decode_pod_spec(manifest);
        pod.status.phase = get_string(state, "status");
        pod.status.host = get_string(state, "host");
        pod.status.host_ip = get_string(state, "hostIP");
        pod.status.pod_ip = get_string(state, "podIP");
        return pod;
    }

    const json &status = get_object(doc, "status");

    pod.spec = decode_pod_spec(get_object(doc, "spec"));
    pod.status.phase = get_string(status, "phase");
    pod.status.host = get_string(status, "host");
    pod.status.host_ip = get_string(status, "hostIP");
    pod.status.pod_ip = get_string(status, "podIP");
    return pod;
}

ReplicationController
JsonCodec::decode_controller(const json &doc) const
{
    ReplicationController rc;

    rc.metadata = decode_meta(doc);

    if (m_layout == Layout::flat) {
        const json &state = get_object(doc, "desiredState");
        const json &tmplt = get_object(state, "podTemplate");

        rc.spec.replicas = get_int(state, "replicas");
        rc.spec.selector = get_labels(state, "replicaSelector");
        rc.spec.pod_template.metadata.labels = get_labels(tmplt, "labels");
        rc.spec.pod_template.spec = decode_pod_spec(
            get_object(get_object(tmplt, "desiredState"), "manifest"));
        return rc;
    }

    const json &spec = get_object(doc, "spec");
    const json &tmplt = get_object(spec, "template");

    rc.spec.replicas = get_int(spec, "replicas");
    rc.spec.selector = get_labels(spec, "selector");
    rc.spec.pod_template.metadata = decode_meta(tmplt);
    rc.spec.pod_template.spec = decode_pod_spec(get_object(tmplt, "spec"));
    return rc;
}

Service
JsonCodec::decode_service(const json &doc) const
{
    const json &spec = (m_layout == Layout::flat) ? doc : get_object(doc, "spec");
    Service svc;

    svc.metadata = decode_meta(doc);
    svc.spec.port = get_int(spec, "port");
    svc.spec.protocol = get_string(spec, "protocol");
    svc.spec.selector = get_labels(spec, "selector");
    svc.spec.portal_ip = get_string(spec, "portalIP");
    return svc;
}

Minion
JsonCodec::decode_minion(const json &doc) const
{
    const json &status = (m_layout == Layout::flat) ? doc : get_object(doc, "status");
    Minion minion;

    minion.metadata = decode_meta(doc);
    minion.host_ip = get_string(status, "hostIP");
    return minion;
}

Status
JsonCodec::decode_status(const json &doc) const
{
    Status status;

    status.metadata = decode_list_meta(doc);
    status.status = get_string(doc, "status");
    status.message = get_string(doc, "message");
    status.reason = get_string(doc, "reason");
    status.code = get_int(doc, "code");
    return status;
}

Event
JsonCodec::decode_event(const json &doc) const
{
    const json &ref = get_object(doc, "involvedObject");
    Event event;

    event.metadata = decode_meta(doc);
    event.involved_object.kind = get_string(ref, "kind");
    event.involved_object.ns = get_string(ref, "namespace");
    event.involved_object.name = get_string(ref, "name");
    event.involved_object.uid = get_string(ref, "uid");
    event.status = get_string(doc, "status");
    event.reason = get_string(doc, "reason");
    event.message = get_string(doc, "message");
    event.source = get_string(doc, "source");
    return event;
}

template <typename List, typename Fn>
std::unique_ptr<Object>
JsonCodec::decode_list(const json &doc, Fn decode_item) const
{
    std::unique_ptr<List> list {new List()};

    list->metadata = decode_list_meta(doc);
    for (const auto &item : get_array(doc, "items")) {
        list->items.push_back(decode_item(item));
    }

    return std::unique_ptr<Object>(list.release());
}

static const std::vector<JsonCodec> &
codecs()
{
    static const std::vector<JsonCodec> all {
        {"v1beta1", Layout::flat},
        {"v1beta2", Layout::flat},
        {"v1beta3", Layout::nested},
    };
    return all;
}

const Codec &
codec_for(const std::string &version)
{
    for (const auto &codec : codecs()) {
        if (codec.version() == version) {
            return codec;
        }
    }

    throw EncodingError("API version \"{}\" is not supported", version);
}

std::vector<std::string>
supported_versions()
{
    std::vector<std::string> versions;

    for (const auto &codec : codecs()) {
        versions.push_back(codec.version());
    }

    return versions;
}

std::unique_ptr<Object>
decode(const json &doc)
{
    if (!doc.is_object()) {
        throw DecodingError("document is not an object");
    }

    const std::string version = get_string(doc, "apiVersion");
    if (version.empty()) {
        throw DecodingError("document has no \"apiVersion\" field");
    }

    const Codec *codec;
    try {
        codec = &codec_for(version);
    } catch (const EncodingError &ex) {
        throw DecodingError("{}", ex.what());
    }

    LOG_TRACE << "Decoding document of kind '" << get_string(doc, "kind") << "', version " << version;
    return codec->decode(doc);
}

std::unique_ptr<Object>
decode_text(const std::string &data)
{
    json doc = json::parse(data, nullptr, false);

    if (doc.is_discarded()) {
        throw DecodingError("document is not a valid JSON");
    }

    return decode(doc);
}

} // api
} // resprint
