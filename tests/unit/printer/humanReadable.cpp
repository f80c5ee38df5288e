/**
 * @file
 * @brief Tests of the tabular printer
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <gtest/gtest.h>

#include <functional>
#include <sstream>
#include <string>
#include <typeindex>
#include <vector>

#include <common/common.hpp>
#include <common/error.hpp>
#include <common/logger.hpp>
#include <printer/humanReadablePrinter.hpp>

using namespace resprint;
using namespace resprint::printer;

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

static std::vector<std::string>
output_lines(const std::string &text)
{
    std::vector<std::string> lines = string_split(text, "\n");

    if (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }
    return lines;
}

static bool
starts_with(const std::string &str, const std::string &prefix)
{
    return str.compare(0, prefix.size(), prefix) == 0;
}

static api::Service
make_service(const std::string &name)
{
    api::Service svc;
    svc.metadata.name = name;
    svc.metadata.labels = {{"app", "web"}};
    svc.spec.selector = {{"app", "web"}, {"tier", "frontend"}};
    svc.spec.portal_ip = "10.0.0.1";
    svc.spec.port = 8080;
    return svc;
}

/** Resource type without a default handler */
class Widget : public api::Object {
public:
    std::string name;

    const char *kind() const override { return "Widget"; }
};

static void
print_widget(const Widget &widget, std::ostream &output)
{
    output << widget.name << "\n";
}

// Print functions that do not have the required form
static void
print_three(const Widget &, std::ostream &, int)
{
}

static int
print_returning(const Widget &, std::ostream &)
{
    return 0;
}

static void
print_wrong_writer(const Widget &, std::ostringstream &)
{
}

static void
print_base(const api::Object &, std::ostream &)
{
}

static void
print_non_resource(const std::string &, std::ostream &)
{
}

static void
print_mutable(Widget &, std::ostream &)
{
}

class HumanReadable : public ::testing::Test {
protected:
    std::ostringstream log;

    void SetUp() override
    {
        Logger::get_instance().set_output(&log);
    }

    void TearDown() override
    {
        Logger::get_instance().set_output(nullptr);
    }
};

TEST_F(HumanReadable, NotVersioned)
{
    HumanReadablePrinter printer;

    EXPECT_FALSE(printer.is_versioned());
}

TEST_F(HumanReadable, DefaultHandlers)
{
    HumanReadablePrinter printer;

    EXPECT_TRUE(printer.has_handler(typeid(api::Pod)));
    EXPECT_TRUE(printer.has_handler(typeid(api::PodList)));
    EXPECT_TRUE(printer.has_handler(typeid(api::ReplicationController)));
    EXPECT_TRUE(printer.has_handler(typeid(api::ReplicationControllerList)));
    EXPECT_TRUE(printer.has_handler(typeid(api::Service)));
    EXPECT_TRUE(printer.has_handler(typeid(api::ServiceList)));
    EXPECT_TRUE(printer.has_handler(typeid(api::Minion)));
    EXPECT_TRUE(printer.has_handler(typeid(api::MinionList)));
    EXPECT_TRUE(printer.has_handler(typeid(api::Status)));
    EXPECT_TRUE(printer.has_handler(typeid(api::Event)));
    EXPECT_TRUE(printer.has_handler(typeid(api::EventList)));
    EXPECT_FALSE(printer.has_handler(typeid(Widget)));
}

TEST_F(HumanReadable, HeaderOncePerType)
{
    HumanReadablePrinter printer;
    std::ostringstream out;

    printer.print_obj(make_service("first"), out);
    printer.print_obj(make_service("second"), out);

    const auto lines = output_lines(out.str());
    ASSERT_EQ(lines.size(), 3U);
    EXPECT_TRUE(starts_with(lines[0], "NAME"));
    EXPECT_TRUE(starts_with(lines[1], "first"));
    EXPECT_TRUE(starts_with(lines[2], "second"));
}

TEST_F(HumanReadable, HeaderOnTypeTransition)
{
    HumanReadablePrinter printer;
    std::ostringstream out;
    api::Minion minion;
    minion.metadata.name = "node-a";

    printer.print_obj(make_service("svc"), out);
    printer.print_obj(minion, out);
    printer.print_obj(make_service("svc"), out);

    const std::string service_header =
        "NAME                LABELS              SELECTOR                IP                  PORT";
    const auto lines = output_lines(out.str());
    ASSERT_EQ(lines.size(), 6U);
    EXPECT_EQ(lines[0], service_header);
    EXPECT_TRUE(starts_with(lines[1], "svc"));
    EXPECT_EQ(lines[2], "NAME");
    EXPECT_EQ(lines[3], "node-a");
    EXPECT_EQ(lines[4], service_header);
    EXPECT_TRUE(starts_with(lines[5], "svc"));
}

TEST_F(HumanReadable, NoHeaders)
{
    HumanReadablePrinter printer {true};
    std::ostringstream out;
    api::Minion minion;
    minion.metadata.name = "node-a";

    printer.print_obj(make_service("svc"), out);
    printer.print_obj(minion, out);

    const auto lines = output_lines(out.str());
    ASSERT_EQ(lines.size(), 2U);
    EXPECT_TRUE(starts_with(lines[0], "svc"));
    EXPECT_EQ(lines[1], "node-a");
}

TEST_F(HumanReadable, ServiceListThenService)
{
    HumanReadablePrinter printer;
    api::ServiceList list;
    list.items = {make_service("frontend"), make_service("backend")};

    std::ostringstream first;
    printer.print_obj(list, first);

    const auto lines = output_lines(first.str());
    ASSERT_EQ(lines.size(), 3U);
    EXPECT_TRUE(starts_with(lines[0], "NAME"));
    EXPECT_EQ(lines[1],
        "frontend            app=web             app=web,tier=frontend   10.0.0.1            8080");
    EXPECT_EQ(lines[2],
        "backend             app=web             app=web,tier=frontend   10.0.0.1            8080");

    std::ostringstream second;
    printer.print_obj(make_service("third"), second);

    const auto more = output_lines(second.str());
    ASSERT_EQ(more.size(), 1U);
    EXPECT_TRUE(starts_with(more[0], "third"));
}

TEST_F(HumanReadable, PodRow)
{
    HumanReadablePrinter printer {true};
    std::ostringstream out;
    api::Pod pod;
    pod.metadata.name = "web-1";
    pod.metadata.labels = {{"app", "web"}};
    pod.spec.containers = {{"nginx", "nginx:1.7"}, {"log", "fluentd"}};
    pod.status.phase = "Running";

    printer.print_obj(pod, out);
    pod.status.host = "node-a";
    pod.status.host_ip = "10.0.0.7";
    printer.print_obj(pod, out);

    const auto lines = output_lines(out.str());
    ASSERT_EQ(lines.size(), 2U);
    EXPECT_EQ(lines[0],
        "web-1               nginx:1.7,fluentd   <unassigned>        app=web             Running");
    EXPECT_EQ(lines[1],
        "web-1               nginx:1.7,fluentd   node-a/10.0.0.7     app=web             Running");
}

TEST_F(HumanReadable, ControllerRow)
{
    HumanReadablePrinter printer {true};
    std::ostringstream out;
    api::ReplicationControllerList list;
    list.items.resize(1);
    list.items[0].metadata.name = "web";
    list.items[0].spec.replicas = 3;
    list.items[0].spec.selector = {{"app", "web"}};
    list.items[0].spec.pod_template.spec.containers = {{"nginx", "nginx"}};

    printer.print_obj(list, out);

    EXPECT_EQ(out.str(),
        "web                 nginx               app=web             3\n");
}

TEST_F(HumanReadable, EventAndStatusRows)
{
    HumanReadablePrinter printer;
    std::ostringstream out;
    api::Event event;
    event.involved_object.name = "web-1";
    event.involved_object.kind = "Pod";
    event.status = "scheduled";
    event.reason = "assigned";
    event.message = "ok";
    api::Status status;
    status.status = "Success";

    printer.print_obj(event, out);
    printer.print_obj(status, out);

    const auto lines = output_lines(out.str());
    ASSERT_EQ(lines.size(), 4U);
    EXPECT_EQ(lines[0],
        "NAME                KIND                STATUS              REASON              MESSAGE");
    EXPECT_EQ(lines[1],
        "web-1               Pod                 scheduled           assigned            ok");
    EXPECT_EQ(lines[2], "STATUS");
    EXPECT_EQ(lines[3], "Success");
}

TEST_F(HumanReadable, EmptyList)
{
    HumanReadablePrinter printer;
    std::ostringstream out;

    printer.print_obj(api::PodList(), out);

    const auto lines = output_lines(out.str());
    ASSERT_EQ(lines.size(), 1U);
    EXPECT_TRUE(starts_with(lines[0], "NAME"));
}

TEST_F(HumanReadable, UnknownType)
{
    HumanReadablePrinter printer;
    std::ostringstream out;
    Widget widget;

    EXPECT_THROW(printer.print_obj(widget, out), UnknownTypeError);
    EXPECT_EQ(out.str(), "");

    try {
        printer.print_obj(widget, out);
    } catch (const UnknownTypeError &ex) {
        EXPECT_NE(std::string(ex.what()).find("Widget"), std::string::npos);
    }
}

TEST_F(HumanReadable, UnknownTypeKeepsHeaderState)
{
    HumanReadablePrinter printer;
    std::ostringstream out;

    printer.print_obj(make_service("a"), out);
    EXPECT_THROW(printer.print_obj(Widget(), out), UnknownTypeError);
    printer.print_obj(make_service("b"), out);

    EXPECT_EQ(output_lines(out.str()).size(), 3U);
}

TEST_F(HumanReadable, CustomHandler)
{
    HumanReadablePrinter printer;
    std::ostringstream out;
    Widget widget;
    widget.name = "gear";

    printer.handler({"WIDGET"}, print_widget);
    EXPECT_TRUE(printer.has_handler(typeid(Widget)));

    printer.print_obj(widget, out);
    EXPECT_EQ(out.str(), "WIDGET\ngear\n");
}

TEST_F(HumanReadable, HandlerFromLambdaAndFunction)
{
    HumanReadablePrinter printer {true};
    std::ostringstream out;
    int calls = 0;

    printer.handler({"A"}, [&calls](const Widget &widget, std::ostream &output) {
        calls++;
        output << "lambda " << widget.name << "\n";
    });
    printer.print_obj(Widget(), out);

    std::function<void(const Widget &, std::ostream &)> fn = print_widget;
    printer.handler({"B"}, fn);
    printer.print_obj(Widget(), out);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(out.str(), "lambda \n\n");
}

TEST_F(HumanReadable, LastRegistrationWins)
{
    HumanReadablePrinter printer;
    std::ostringstream out;

    printer.handler({"FIRST"}, print_widget);
    printer.handler({"SECOND"}, [](const Widget &, std::ostream &output) {
        output << "replaced\n";
    });
    printer.print_obj(Widget(), out);

    EXPECT_EQ(out.str(), "SECOND\nreplaced\n");
}

TEST_F(HumanReadable, MalformedHandlers)
{
    HumanReadablePrinter printer;
    printer.handler({"ORIGINAL"}, print_widget);

    EXPECT_THROW(printer.handler({"BAD"}, print_three), MalformedHandler);
    EXPECT_THROW(printer.handler({"BAD"}, print_returning), MalformedHandler);
    EXPECT_THROW(printer.handler({"BAD"}, print_wrong_writer), MalformedHandler);
    EXPECT_THROW(printer.handler({"BAD"}, print_base), MalformedHandler);
    EXPECT_THROW(printer.handler({"BAD"}, print_non_resource), MalformedHandler);
    EXPECT_THROW(printer.handler({"BAD"}, print_mutable), MalformedHandler);
    EXPECT_THROW(printer.handler({"BAD"}, 42), MalformedHandler);
    EXPECT_THROW(printer.handler({"BAD"}, [](const auto &, std::ostream &) {}), MalformedHandler);

    // The original handler is kept
    Widget widget;
    widget.name = "gear";
    std::ostringstream out;
    printer.print_obj(widget, out);
    EXPECT_EQ(out.str(), "ORIGINAL\ngear\n");
}

TEST_F(HumanReadable, MalformedHandlerIsLogged)
{
    HumanReadablePrinter printer;

    EXPECT_THROW(printer.handler({"BAD"}, print_three), MalformedHandler);
    EXPECT_NE(log.str().find("WARNING: "), std::string::npos);
    EXPECT_FALSE(printer.has_handler(typeid(Widget)));
}

TEST_F(HumanReadable, HandlerErrorPropagates)
{
    HumanReadablePrinter printer;
    std::ostringstream out;

    printer.handler({"WIDGET"}, [](const Widget &widget, std::ostream &output) {
        output << "partial\n";
        throw WriteError("cannot print {}", widget.name);
    });

    EXPECT_THROW(printer.print_obj(Widget(), out), WriteError);
    // Buffered output is flushed
    EXPECT_EQ(out.str(), "WIDGET\npartial\n");

    // The header was already printed for the type
    out.str("");
    EXPECT_THROW(printer.print_obj(Widget(), out), WriteError);
    EXPECT_EQ(out.str(), "partial\n");
}

static void
print_name_or_fail(const api::Service &svc, std::ostream &output)
{
    if (svc.metadata.name == "fail") {
        throw WriteError("cannot print {}", svc.metadata.name);
    }
    output << svc.metadata.name << "\n";
}

TEST_F(HumanReadable, ListCombinatorStopsOnFirstFailure)
{
    api::ServiceList list;
    list.items = {make_service("a"), make_service("fail"), make_service("c")};
    std::vector<std::string> visited;
    std::ostringstream out;

    auto print_list = detail::print_each<api::ServiceList>(
        [&visited](const api::Service &svc, std::ostream &output) {
            visited.push_back(svc.metadata.name);
            print_name_or_fail(svc, output);
        });

    EXPECT_THROW(print_list(list, out), WriteError);
    EXPECT_EQ(visited, (std::vector<std::string> {"a", "fail"}));
    EXPECT_EQ(out.str(), "a\n");
}

TEST_F(HumanReadable, ListHandlerStopsOnFirstFailure)
{
    HumanReadablePrinter printer {true};
    std::ostringstream out;
    api::ServiceList list;
    list.items = {make_service("a"), make_service("fail"), make_service("c")};

    printer.handler({"NAME"}, detail::print_each<api::ServiceList>(print_name_or_fail));

    EXPECT_THROW(printer.print_obj(list, out), WriteError);
    // Rows before the failure are flushed, rows after it are never written
    EXPECT_EQ(out.str(), "a\n");
}
