/**
 * @file
 * @brief Tests of text templates and the template printer
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include <common/error.hpp>
#include <printer/template.hpp>
#include <printer/templatePrinter.hpp>

using namespace resprint;
using namespace resprint::printer;
using nlohmann::json;

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

static std::string
render(const std::string &text, const json &data)
{
    Template tmpl {"test", text};
    std::ostringstream out;

    tmpl.execute(out, data);
    return out.str();
}

static const json g_doc = {
    {"kind", "PodList"},
    {"items", {
        {{"id", "web-1"}, {"labels", {{"app", "web"}}}, {"replicas", 2}},
        {{"id", "db-1"}, {"labels", json::object()}, {"replicas", 0}},
    }},
    {"port", 8080},
    {"ratio", 0.5},
    {"enabled", true},
    {"missing", nullptr},
    {"empty", ""},
};

TEST(Template, Text)
{
    EXPECT_EQ(render("plain text\n", g_doc), "plain text\n");
    EXPECT_EQ(render("", g_doc), "");
}

TEST(Template, Fields)
{
    EXPECT_EQ(render("{{.kind}}", g_doc), "PodList");
    EXPECT_EQ(render("{{.port}} {{.ratio}} {{.enabled}}", g_doc), "8080 0.5 true");
    EXPECT_EQ(render("{{.missing}}", g_doc), "<no value>");
    EXPECT_EQ(render("[{{.empty}}]", g_doc), "[]");
    EXPECT_EQ(render("{{$.kind}}", g_doc), "PodList");
}

TEST(Template, CompositeValues)
{
    const json data = {{"list", {"a", "b", 3}}, {"map", {{"z", 1}, {"a", nullptr}}}};

    EXPECT_EQ(render("{{.list}}", data), "[a b 3]");
    EXPECT_EQ(render("{{.map}}", data), "map[a:<nil> z:1]");
}

TEST(Template, Range)
{
    EXPECT_EQ(render("{{range .items}}{{.id}};{{end}}", g_doc), "web-1;db-1;");
    EXPECT_EQ(render("{{range $i, $e := .items}}{{$i}}={{$e.id}} {{end}}", g_doc), "0=web-1 1=db-1 ");
    EXPECT_EQ(render("{{range $e := .items}}{{$e.replicas}}{{end}}", g_doc), "20");
    EXPECT_EQ(render("{{range $k, $v := (index .items 0).labels}}{{$k}}:{{$v}}{{end}}", g_doc), "app:web");
    EXPECT_EQ(render("{{range .none}}x{{else}}empty{{end}}", json {{"none", json::array()}}), "empty");
    EXPECT_EQ(render("{{range .missing}}x{{else}}nothing{{end}}", g_doc), "nothing");
}

TEST(Template, IfElse)
{
    EXPECT_EQ(render("{{if .enabled}}on{{else}}off{{end}}", g_doc), "on");
    EXPECT_EQ(render("{{if .empty}}set{{else}}unset{{end}}", g_doc), "unset");
    EXPECT_EQ(render("{{range .items}}{{if .replicas}}{{.id}}{{else if .labels}}x{{else}}-{{end}}{{end}}", g_doc),
        "web-1-");
    EXPECT_EQ(render("{{if eq .port 80}}http{{else if eq .port 8080}}alt{{else}}other{{end}}", g_doc), "alt");
}

TEST(Template, With)
{
    EXPECT_EQ(render("{{with index .items 0}}{{.id}}{{end}}", g_doc), "web-1");
    EXPECT_EQ(render("{{with .empty}}x{{else}}none{{end}}", g_doc), "none");
}

TEST(Template, Variables)
{
    EXPECT_EQ(render("{{$name := .kind}}{{range .items}}{{$name}}/{{.id}} {{end}}", g_doc),
        "PodList/web-1 PodList/db-1 ");
    EXPECT_EQ(render("{{range .items}}{{$.kind}}{{end}}", g_doc), "PodListPodList");
}

TEST(Template, Trim)
{
    EXPECT_EQ(render("a  {{- .kind -}}  \n b", g_doc), "aPodListb");
    EXPECT_EQ(render("{{range .items -}}\n  {{.id}}\n{{- end}}", g_doc), "web-1db-1");
}

TEST(Template, Comments)
{
    EXPECT_EQ(render("a{{/* comment */}}b", g_doc), "ab");
    EXPECT_EQ(render("a {{- /* comment */ -}} b", g_doc), "ab");
}

TEST(Template, Literals)
{
    EXPECT_EQ(render("{{\"quoted\\t\\\"x\\\"\"}}", g_doc), "quoted\t\"x\"");
    EXPECT_EQ(render("{{`raw\\n`}}", g_doc), "raw\\n");
    EXPECT_EQ(render("{{42}} {{-7}} {{1.5}} {{true}}", g_doc), "42 -7 1.5 true");
}

TEST(Template, Functions)
{
    EXPECT_EQ(render("{{len .items}} {{len .kind}} {{len .empty}}", g_doc), "2 7 0");
    EXPECT_EQ(render("{{index .items 1 \"id\"}}", g_doc), "db-1");
    EXPECT_EQ(render("{{not .enabled}} {{and .enabled .port}} {{or .empty .kind}}", g_doc),
        "false 8080 PodList");
    EXPECT_EQ(render("{{eq .kind \"PodList\"}} {{ne .port 80}} {{eq .port 1 2 8080}}", g_doc),
        "true true true");
    EXPECT_EQ(render("{{lt 1 2}} {{le 2 2}} {{gt 1 2}} {{ge .ratio 0.5}} {{lt \"a\" \"b\"}}", g_doc),
        "true true false true true");
}

TEST(Template, ShortCircuit)
{
    // The second argument would fail
    EXPECT_EQ(render("{{or .enabled .missing.field}}", g_doc), "true");
    EXPECT_EQ(render("{{and .empty .missing.field}}", g_doc), "");
}

TEST(Template, Print)
{
    EXPECT_EQ(render("{{print \"a\" \"b\" 1 2}}", g_doc), "ab1 2");
    EXPECT_EQ(render("{{println .kind .port}}", g_doc), "PodList 8080\n");
    EXPECT_EQ(render("{{printf \"%s:%d\" .kind .port}}", g_doc), "PodList:8080");
    EXPECT_EQ(render("{{printf \"%-6s|%5d|%.2f|%q|%v%%\" \"ab\" 42 .ratio \"x\" .enabled}}", g_doc),
        "ab    |   42|0.50|\"x\"|true%");
    EXPECT_EQ(render("{{printf \"%d\"}}", g_doc), "%!d(MISSING)");
}

TEST(Template, Pipelines)
{
    EXPECT_EQ(render("{{.items | len}}", g_doc), "2");
    EXPECT_EQ(render("{{.port | printf \"port %d\"}}", g_doc), "port 8080");
    EXPECT_EQ(render("{{(index .items 0).id | printf \"%s!\"}}", g_doc), "web-1!");
}

TEST(Template, ParseErrors)
{
    EXPECT_THROW(Template("t", "{{.kind"), TemplateParseError);
    EXPECT_THROW(Template("t", "{{if .kind}}x"), TemplateParseError);
    EXPECT_THROW(Template("t", "{{end}}"), TemplateParseError);
    EXPECT_THROW(Template("t", "{{else}}"), TemplateParseError);
    EXPECT_THROW(Template("t", "{{nosuchfn .kind}}"), TemplateParseError);
    EXPECT_THROW(Template("t", "{{$undefined}}"), TemplateParseError);
    EXPECT_THROW(Template("t", "{{\"unterminated}}"), TemplateParseError);
    EXPECT_THROW(Template("t", "{{}}"), TemplateParseError);
    EXPECT_THROW(Template("t", "{{.kind | .port}}"), TemplateParseError);
    EXPECT_THROW(Template("t", "{{/* unclosed }}"), TemplateParseError);
    EXPECT_THROW(Template("t", "{{if $x := 1}}{{end}}{{$x}}"), TemplateParseError);

    try {
        Template("name", "line\n{{nosuchfn}}");
        FAIL() << "Exception expected";
    } catch (const TemplateParseError &ex) {
        EXPECT_EQ(std::string(ex.what()), "template: name:2: function \"nosuchfn\" not defined");
    }
}

TEST(Template, ExecErrors)
{
    EXPECT_THROW(render("{{.nosuchkey}}", g_doc), TemplateExecError);
    EXPECT_THROW(render("{{.kind.name}}", g_doc), TemplateExecError);
    EXPECT_THROW(render("{{.missing.name}}", g_doc), TemplateExecError);
    EXPECT_THROW(render("{{range .port}}{{end}}", g_doc), TemplateExecError);
    EXPECT_THROW(render("{{index .items 5}}", g_doc), TemplateExecError);
    EXPECT_THROW(render("{{eq .kind 1}}", g_doc), TemplateExecError);
    EXPECT_THROW(render("{{len .port}}", g_doc), TemplateExecError);
    EXPECT_THROW(render("{{not}}", g_doc), TemplateExecError);

    try {
        render("{{.nosuchkey}}", g_doc);
        FAIL() << "Exception expected";
    } catch (const TemplateExecError &ex) {
        EXPECT_NE(std::string(ex.what()).find("map has no entry for key \"nosuchkey\""), std::string::npos);
    }
}

TEST(Template, OutputBeforeErrorIsKept)
{
    Template tmpl {"t", "before {{.nosuchkey}} after"};
    std::ostringstream out;

    EXPECT_THROW(tmpl.execute(out, g_doc), TemplateExecError);
    EXPECT_EQ(out.str(), "before ");
}

TEST(Template, WriteFailure)
{
    Template tmpl {"t", "text"};
    std::ostringstream out;
    out.setstate(std::ios::badbit);

    EXPECT_THROW(tmpl.execute(out, g_doc), WriteError);
}

TEST(TemplatePrinter, VersionedMap)
{
    api::Service svc;
    svc.metadata.name = "frontend";
    svc.spec.port = 80;
    std::ostringstream out;

    TemplatePrinter flat {"v1beta1", "{{.id}}:{{.port}}\n"};
    flat.print_obj(svc, out);

    TemplatePrinter nested {"v1beta3", "{{.metadata.name}}:{{.spec.port}} {{.apiVersion}}\n"};
    nested.print_obj(svc, out);

    EXPECT_EQ(out.str(), "frontend:80\nfrontend:80 v1beta3\n");
    EXPECT_TRUE(flat.is_versioned());
}

TEST(TemplatePrinter, ListItems)
{
    api::PodList list;
    list.items.resize(2);
    list.items[0].metadata.name = "a";
    list.items[1].metadata.name = "b";
    std::ostringstream out;

    TemplatePrinter printer {"v1beta1", "{{range .items}}{{.id}}\n{{end}}"};
    printer.print_obj(list, out);

    EXPECT_EQ(out.str(), "a\nb\n");
}

TEST(TemplatePrinter, MissingField)
{
    TemplatePrinter printer {"v1beta1", "{{.metadata.name}}"};
    api::Minion minion;
    std::ostringstream out;

    EXPECT_THROW(printer.print_obj(minion, out), TemplateExecError);
}
