/**
 * @file
 * @brief Resource object model
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace resprint {
namespace api {

/** @brief Label or selector key/value pairs */
using LabelMap = std::map<std::string, std::string>;

/**
 * @brief Base of all resource objects.
 *
 * Objects are identified by their dynamic type. The kind is the name of the
 * type used in encoded documents.
 */
class Object {
public:
    virtual
    ~Object() = default;

    virtual const char *
    kind() const = 0;
};

/** @brief Metadata common to all named resources */
struct ObjectMeta {
    std::string name;
    std::string ns;
    std::string uid;
    std::string creation_timestamp;
    LabelMap labels;
};

/** @brief Metadata of resource lists */
struct ListMeta {
    std::string self_link;
    std::string resource_version;
};

struct Container {
    std::string name;
    std::string image;
};

struct PodSpec {
    std::vector<Container> containers;
    std::string restart_policy;
};

struct PodStatus {
    /** @brief Phase of the pod (Waiting, Running, Terminated) */
    std::string phase;
    std::string host;
    std::string host_ip;
    std::string pod_ip;
};

class Pod : public Object {
public:
    ObjectMeta metadata;
    PodSpec spec;
    PodStatus status;

    const char *kind() const override { return "Pod"; }
};

class PodList : public Object {
public:
    using Item = Pod;

    ListMeta metadata;
    std::vector<Pod> items;

    const char *kind() const override { return "PodList"; }
};

struct PodTemplateSpec {
    ObjectMeta metadata;
    PodSpec spec;
};

struct ReplicationControllerSpec {
    int32_t replicas = 0;
    LabelMap selector;
    PodTemplateSpec pod_template;
};

class ReplicationController : public Object {
public:
    ObjectMeta metadata;
    ReplicationControllerSpec spec;

    const char *kind() const override { return "ReplicationController"; }
};

class ReplicationControllerList : public Object {
public:
    using Item = ReplicationController;

    ListMeta metadata;
    std::vector<ReplicationController> items;

    const char *kind() const override { return "ReplicationControllerList"; }
};

struct ServiceSpec {
    int32_t port = 0;
    std::string protocol;
    LabelMap selector;
    std::string portal_ip;
};

class Service : public Object {
public:
    ObjectMeta metadata;
    ServiceSpec spec;

    const char *kind() const override { return "Service"; }
};

class ServiceList : public Object {
public:
    using Item = Service;

    ListMeta metadata;
    std::vector<Service> items;

    const char *kind() const override { return "ServiceList"; }
};

class Minion : public Object {
public:
    ObjectMeta metadata;
    std::string host_ip;

    const char *kind() const override { return "Minion"; }
};

class MinionList : public Object {
public:
    using Item = Minion;

    ListMeta metadata;
    std::vector<Minion> items;

    const char *kind() const override { return "MinionList"; }
};

/** @brief Result of an operation that does not return an object */
class Status : public Object {
public:
    ListMeta metadata;
    /** @brief "Success" or "Failure" */
    std::string status;
    std::string message;
    std::string reason;
    int32_t code = 0;

    const char *kind() const override { return "Status"; }
};

/** @brief Reference to another resource */
struct ObjectReference {
    std::string kind;
    std::string ns;
    std::string name;
    std::string uid;
};

class Event : public Object {
public:
    ObjectMeta metadata;
    ObjectReference involved_object;
    std::string status;
    std::string reason;
    std::string message;
    std::string source;

    const char *kind() const override { return "Event"; }
};

class EventList : public Object {
public:
    using Item = Event;

    ListMeta metadata;
    std::vector<Event> items;

    const char *kind() const override { return "EventList"; }
};

} // api
} // resprint
