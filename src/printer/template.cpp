/**
 * @file
 * @brief Text templates evaluated over generic documents
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include <common/common.hpp>
#include <common/error.hpp>

#include <printer/template.hpp>

namespace resprint {
namespace printer {
namespace tmpl {

using nlohmann::json;

static const char *g_functions[] = {
    "and", "or", "not", "len", "index", "eq", "ne", "lt", "le", "gt", "ge",
    "print", "printf", "println",
};

enum class TokenType {
    text,
    left_delim,
    right_delim,
    dot,
    field,
    variable,
    identifier,
    keyword,
    string,
    number,
    boolean,
    nil,
    pipe,
    left_paren,
    right_paren,
    declare,
    comma,
    eof,
};

struct Token {
    TokenType type;
    /** Text, name of identifier, keyword or variable, value of literal */
    std::string value;
    /** Field chain of field and variable tokens */
    std::vector<std::string> fields;
    int line;
    /** Field chain directly follows a closing parenthesis */
    bool chained = false;
};

static bool
is_ident_start(char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

static bool
is_ident_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

static bool
is_space(char c)
{
    return std::isspace(static_cast<unsigned char>(c));
}

/**
 * @brief Split template text into tokens.
 */
class Lexer {
public:
    Lexer(const std::string &name, const std::string &text)
        : m_name(name), m_text(text) {};

    std::vector<Token>
    run();

private:
    const std::string &m_name;
    const std::string &m_text;
    size_t m_pos = 0;
    int m_line = 1;
    bool m_trim_next = false;
    std::vector<Token> m_tokens;

    [[noreturn]] void error(const std::string &msg) const;

    char at(size_t pos) const { return (pos < m_text.size()) ? m_text[pos] : '\0'; }
    bool is_trim_marker(size_t pos) const { return at(pos) == '-' && is_space(at(pos + 1)); }
    void advance_to(size_t pos);
    void emit(TokenType type, std::string value = "");

    void lex_comment();
    void lex_action();
    void lex_fields(std::vector<std::string> &fields);
    void lex_number();
    void lex_quote();
    void lex_raw_quote();
    void lex_identifier();
};

void
Lexer::error(const std::string &msg) const
{
    throw TemplateParseError("template: {}:{}: {}", m_name, m_line, msg);
}

void
Lexer::advance_to(size_t pos)
{
    for (; m_pos < pos && m_pos < m_text.size(); m_pos++) {
        if (m_text[m_pos] == '\n') {
            m_line++;
        }
    }
}

void
Lexer::emit(TokenType type, std::string value)
{
    m_tokens.push_back({type, std::move(value), {}, m_line});
}

std::vector<Token>
Lexer::run()
{
    while (m_pos < m_text.size()) {
        const size_t start = m_text.find("{{", m_pos);
        const size_t end = (start != std::string::npos) ? start : m_text.size();
        std::string text = m_text.substr(m_pos, end - m_pos);
        const int line = m_line;

        if (m_trim_next) {
            string_ltrim(text);
            m_trim_next = false;
        }

        const bool trim_left = (start != std::string::npos) && is_trim_marker(start + 2);
        if (trim_left) {
            string_rtrim(text);
        }

        if (!text.empty()) {
            m_tokens.push_back({TokenType::text, std::move(text), {}, line});
        }

        advance_to(end);
        if (start == std::string::npos) {
            break;
        }

        advance_to(start + 2 + (trim_left ? 2 : 0));
        if (m_text.compare(m_pos, 2, "/*") == 0) {
            lex_comment();
        } else {
            lex_action();
        }
    }

    emit(TokenType::eof);
    return std::move(m_tokens);
}

void
Lexer::lex_comment()
{
    const size_t end = m_text.find("*/", m_pos + 2);
    if (end == std::string::npos) {
        error("unclosed comment");
    }
    advance_to(end + 2);

    if (m_text.compare(m_pos, 4, " -}}") == 0) {
        m_trim_next = true;
        advance_to(m_pos + 4);
    } else if (m_text.compare(m_pos, 2, "}}") == 0) {
        advance_to(m_pos + 2);
    } else {
        error("comment ends before closing delimiter");
    }
}

void
Lexer::lex_action()
{
    emit(TokenType::left_delim);

    for (;;) {
        if (m_pos >= m_text.size()) {
            error("unclosed action");
        }

        const char c = m_text[m_pos];

        if (c == '-' && m_text.compare(m_pos, 3, "-}}") == 0 && m_pos > 0 && is_space(m_text[m_pos - 1])) {
            m_trim_next = true;
            advance_to(m_pos + 3);
            emit(TokenType::right_delim);
            return;
        }
        if (m_text.compare(m_pos, 2, "}}") == 0) {
            advance_to(m_pos + 2);
            emit(TokenType::right_delim);
            return;
        }
        if (is_space(c)) {
            advance_to(m_pos + 1);
            continue;
        }

        if (c == '.' && is_ident_start(at(m_pos + 1))) {
            const bool chained = (m_pos > 0 && m_text[m_pos - 1] == ')');
            std::vector<std::string> fields;
            lex_fields(fields);
            m_tokens.push_back({TokenType::field, "", std::move(fields), m_line, chained});
        } else if (c == '$') {
            size_t end = m_pos + 1;
            while (is_ident_char(at(end))) {
                end++;
            }

            std::string name = m_text.substr(m_pos, end - m_pos);
            std::vector<std::string> fields;
            advance_to(end);
            lex_fields(fields);
            m_tokens.push_back({TokenType::variable, std::move(name), std::move(fields), m_line});
        } else if (std::isdigit(static_cast<unsigned char>(c))
                || ((c == '-' || c == '+' || c == '.') && std::isdigit(static_cast<unsigned char>(at(m_pos + 1))))) {
            lex_number();
        } else if (c == '.') {
            advance_to(m_pos + 1);
            emit(TokenType::dot);
        } else if (c == '"') {
            lex_quote();
        } else if (c == '`') {
            lex_raw_quote();
        } else if (is_ident_start(c)) {
            lex_identifier();
        } else if (c == '|') {
            advance_to(m_pos + 1);
            emit(TokenType::pipe);
        } else if (c == '(') {
            advance_to(m_pos + 1);
            emit(TokenType::left_paren);
        } else if (c == ')') {
            advance_to(m_pos + 1);
            emit(TokenType::right_paren);
        } else if (c == ',') {
            advance_to(m_pos + 1);
            emit(TokenType::comma);
        } else if (c == ':' && at(m_pos + 1) == '=') {
            advance_to(m_pos + 2);
            emit(TokenType::declare);
        } else {
            error(fmt::format("unexpected \"{}\" in command", c));
        }
    }
}

void
Lexer::lex_fields(std::vector<std::string> &fields)
{
    while (at(m_pos) == '.' && is_ident_start(at(m_pos + 1))) {
        size_t end = m_pos + 1;
        while (is_ident_char(at(end))) {
            end++;
        }

        fields.push_back(m_text.substr(m_pos + 1, end - m_pos - 1));
        advance_to(end);
    }
}

void
Lexer::lex_number()
{
    size_t end = m_pos + 1;

    for (;; end++) {
        const char c = at(end);
        const char prev = at(end - 1);

        if (is_ident_char(c) || c == '.') {
            continue;
        }
        if ((c == '+' || c == '-') && (prev == 'e' || prev == 'E')) {
            continue;
        }
        break;
    }

    std::string value = m_text.substr(m_pos, end - m_pos);
    advance_to(end);
    emit(TokenType::number, std::move(value));
}

void
Lexer::lex_quote()
{
    std::string value;
    size_t pos = m_pos + 1;

    for (;; pos++) {
        const char c = at(pos);

        if (c == '\0' || c == '\n') {
            error("unterminated quoted string");
        }
        if (c == '"') {
            break;
        }
        if (c != '\\') {
            value.push_back(c);
            continue;
        }

        switch (at(++pos)) {
        case 'n':  value.push_back('\n'); break;
        case 't':  value.push_back('\t'); break;
        case 'r':  value.push_back('\r'); break;
        case '\\': value.push_back('\\'); break;
        case '"':  value.push_back('"');  break;
        case '\'': value.push_back('\''); break;
        default:
            error("invalid escape sequence in quoted string");
        }
    }

    advance_to(pos + 1);
    emit(TokenType::string, std::move(value));
}

void
Lexer::lex_raw_quote()
{
    const size_t end = m_text.find('`', m_pos + 1);
    if (end == std::string::npos) {
        error("unterminated raw quoted string");
    }

    std::string value = m_text.substr(m_pos + 1, end - m_pos - 1);
    const int line = m_line;
    advance_to(end + 1);
    m_tokens.push_back({TokenType::string, std::move(value), {}, line});
}

void
Lexer::lex_identifier()
{
    size_t end = m_pos;
    while (is_ident_char(at(end))) {
        end++;
    }

    std::string word = m_text.substr(m_pos, end - m_pos);
    advance_to(end);

    if (word == "if" || word == "else" || word == "end" || word == "range" || word == "with") {
        emit(TokenType::keyword, std::move(word));
    } else if (word == "true" || word == "false") {
        emit(TokenType::boolean, std::move(word));
    } else if (word == "nil") {
        emit(TokenType::nil);
    } else {
        emit(TokenType::identifier, std::move(word));
    }
}

struct Pipeline;

enum class OperandType {
    dot,
    field,
    variable,
    literal,
    function,
    pipeline,
};

struct Operand {
    OperandType type;
    /** Name of a function or a variable */
    std::string name;
    std::vector<std::string> fields;
    json literal;
    std::shared_ptr<Pipeline> pipeline;
};

struct Command {
    std::vector<Operand> operands;
};

struct Pipeline {
    int line = 0;
    /** Declared variables */
    std::vector<std::string> decl;
    std::vector<Command> commands;
};

enum class NodeType {
    text,
    action,
    if_block,
    range_block,
    with_block,
};

struct Node {
    NodeType type;
    int line;
    std::string text;
    Pipeline pipe;
    std::vector<Node> list;
    std::vector<Node> else_list;
};

/**
 * @brief Build the tree of a template from tokens.
 */
class Parser {
public:
    Parser(const std::string &name, std::vector<Token> tokens)
        : m_name(name), m_tokens(std::move(tokens)) {};

    std::vector<Node>
    parse();

private:
    const std::string &m_name;
    std::vector<Token> m_tokens;
    size_t m_idx = 0;
    std::vector<std::string> m_vars {"$"};

    [[noreturn]] void error(int line, const std::string &msg) const;

    const Token &peek(size_t ahead = 0) const;
    const Token &next();
    void expect(TokenType type, const char *context);

    std::string parse_list(std::vector<Node> &list);
    Node parse_control(NodeType type, int line);
    Pipeline parse_pipeline(const char *context, bool is_range);
    Command parse_command(const char *context);
    Operand parse_operand();
};

void
Parser::error(int line, const std::string &msg) const
{
    throw TemplateParseError("template: {}:{}: {}", m_name, line, msg);
}

const Token &
Parser::peek(size_t ahead) const
{
    const size_t idx = m_idx + ahead;
    // The last token is always eof
    return (idx < m_tokens.size()) ? m_tokens[idx] : m_tokens.back();
}

const Token &
Parser::next()
{
    const Token &tok = peek();
    if (m_idx < m_tokens.size() - 1) {
        m_idx++;
    }
    return tok;
}

void
Parser::expect(TokenType type, const char *context)
{
    const Token &tok = next();

    if (tok.type != type) {
        error(tok.line, fmt::format("unexpected token in {}", context));
    }
}

std::vector<Node>
Parser::parse()
{
    std::vector<Node> root;
    const std::string term = parse_list(root);

    if (!term.empty()) {
        error(peek().line, fmt::format("unexpected {{{{{}}}}}", term));
    }

    return root;
}

/**
 * @brief Parse nodes until the end of the template or an {{else}}/{{end}} action.
 * @return The terminating keyword or an empty string at the end of template.
 */
std::string
Parser::parse_list(std::vector<Node> &list)
{
    for (;;) {
        const Token &tok = next();

        switch (tok.type) {
        case TokenType::eof:
            return "";
        case TokenType::text:
            list.push_back({NodeType::text, tok.line, tok.value, {}, {}, {}});
            break;
        case TokenType::left_delim: {
            if (peek().type == TokenType::keyword) {
                const Token &keyword = next();

                if (keyword.value == "else" || keyword.value == "end") {
                    return keyword.value;
                } else if (keyword.value == "if") {
                    list.push_back(parse_control(NodeType::if_block, keyword.line));
                } else if (keyword.value == "range") {
                    list.push_back(parse_control(NodeType::range_block, keyword.line));
                } else {
                    list.push_back(parse_control(NodeType::with_block, keyword.line));
                }
                break;
            }

            Node action {NodeType::action, tok.line, "", {}, {}, {}};
            action.pipe = parse_pipeline("command", false);
            expect(TokenType::right_delim, "command");
            list.push_back(std::move(action));
            break;
        }
        default:
            error(tok.line, "unexpected token outside of action");
        }
    }
}

Node
Parser::parse_control(NodeType type, int line)
{
    static const char *names[] = {"", "", "if", "range", "with"};
    const char *name = names[static_cast<int>(type)];
    const size_t scope = m_vars.size();
    Node node {type, line, "", {}, {}, {}};

    node.pipe = parse_pipeline(name, type == NodeType::range_block);
    expect(TokenType::right_delim, name);

    std::string term = parse_list(node.list);
    if (term.empty()) {
        error(line, fmt::format("unexpected EOF in {}", name));
    }

    if (term == "else") {
        const Token &tok = peek();

        if (type != NodeType::range_block && tok.type == TokenType::keyword && tok.value == name) {
            // "else if" and "else with" share {{end}} with the enclosing block
            next();
            node.else_list.push_back(parse_control(type, tok.line));
        } else {
            expect(TokenType::right_delim, "else");
            term = parse_list(node.else_list);
            if (term != "end") {
                error(line, fmt::format("expected end of {}", name));
            }
            expect(TokenType::right_delim, "end");
        }
    } else {
        expect(TokenType::right_delim, "end");
    }

    m_vars.resize(scope);
    return node;
}

Pipeline
Parser::parse_pipeline(const char *context, bool is_range)
{
    Pipeline pipe;
    pipe.line = peek().line;

    if (peek().type == TokenType::variable && peek().fields.empty()) {
        if (peek(1).type == TokenType::declare) {
            pipe.decl.push_back(next().value);
            next();
        } else if (peek(1).type == TokenType::comma
                && peek(2).type == TokenType::variable && peek(2).fields.empty()
                && peek(3).type == TokenType::declare) {
            if (!is_range) {
                error(pipe.line, fmt::format("too many declarations in {}", context));
            }
            pipe.decl.push_back(next().value);
            next();
            pipe.decl.push_back(next().value);
            next();
        }
    }

    for (;;) {
        Command cmd = parse_command(context);

        const Operand &first = cmd.operands.front();
        if (!pipe.commands.empty() && first.type != OperandType::function) {
            error(pipe.line, fmt::format("non executable command in pipeline stage {}",
                pipe.commands.size() + 1));
        }

        pipe.commands.push_back(std::move(cmd));
        if (peek().type != TokenType::pipe) {
            break;
        }
        next();
    }

    for (const auto &var : pipe.decl) {
        m_vars.push_back(var);
    }

    return pipe;
}

Command
Parser::parse_command(const char *context)
{
    Command cmd;

    for (;;) {
        const TokenType type = peek().type;

        if (type == TokenType::right_delim || type == TokenType::right_paren
                || type == TokenType::pipe || type == TokenType::eof) {
            break;
        }
        cmd.operands.push_back(parse_operand());
    }

    if (cmd.operands.empty()) {
        error(peek().line, fmt::format("missing value for {}", context));
    }

    return cmd;
}

Operand
Parser::parse_operand()
{
    const Token &tok = next();
    Operand op {OperandType::literal, "", {}, nullptr, nullptr};

    switch (tok.type) {
    case TokenType::dot:
        op.type = OperandType::dot;
        break;
    case TokenType::field:
        op.type = OperandType::field;
        op.fields = tok.fields;
        break;
    case TokenType::variable: {
        bool declared = false;
        for (const auto &var : m_vars) {
            declared = declared || (var == tok.value);
        }
        if (!declared) {
            error(tok.line, fmt::format("undefined variable \"{}\"", tok.value));
        }

        op.type = OperandType::variable;
        op.name = tok.value;
        op.fields = tok.fields;
        break;
    }
    case TokenType::string:
        op.literal = tok.value;
        break;
    case TokenType::boolean:
        op.literal = (tok.value == "true");
        break;
    case TokenType::nil:
        op.literal = nullptr;
        break;
    case TokenType::number: {
        char *end;
        errno = 0;
        const long long integer = std::strtoll(tok.value.c_str(), &end, 0);
        if (errno == 0 && *end == '\0') {
            op.literal = static_cast<int64_t>(integer);
            break;
        }

        const double real = std::strtod(tok.value.c_str(), &end);
        if (*end != '\0') {
            error(tok.line, fmt::format("bad number syntax: \"{}\"", tok.value));
        }
        op.literal = real;
        break;
    }
    case TokenType::identifier: {
        bool known = false;
        for (const char *fn : g_functions) {
            known = known || (tok.value == fn);
        }
        if (!known) {
            error(tok.line, fmt::format("function \"{}\" not defined", tok.value));
        }

        op.type = OperandType::function;
        op.name = tok.value;
        break;
    }
    case TokenType::left_paren:
        op.type = OperandType::pipeline;
        op.pipeline = std::make_shared<Pipeline>(parse_pipeline("parenthesized pipeline", false));
        expect(TokenType::right_paren, "parenthesized pipeline");
        if (peek().type == TokenType::field && peek().chained) {
            op.fields = next().fields;
        }
        break;
    default:
        error(tok.line, "unexpected token in operand");
    }

    return op;
}

static bool
is_true(const json &value)
{
    switch (value.type()) {
    case json::value_t::boolean:
        return value.get<bool>();
    case json::value_t::number_integer:
        return value.get<int64_t>() != 0;
    case json::value_t::number_unsigned:
        return value.get<uint64_t>() != 0;
    case json::value_t::number_float:
        return value.get<double>() != 0.0;
    case json::value_t::string:
    case json::value_t::array:
    case json::value_t::object:
        return !value.empty();
    default:
        return false;
    }
}

/**
 * @brief Format a value the way it is printed by an action.
 *
 * Nested values are part of an array or a map.
 */
static std::string
to_text(const json &value, bool nested = true)
{
    std::string result;

    switch (value.type()) {
    case json::value_t::null:
        return nested ? "<nil>" : "<no value>";
    case json::value_t::string:
        return value.get<std::string>();
    case json::value_t::boolean:
        return value.get<bool>() ? "true" : "false";
    case json::value_t::number_integer:
        return std::to_string(value.get<int64_t>());
    case json::value_t::number_unsigned:
        return std::to_string(value.get<uint64_t>());
    case json::value_t::number_float:
        return fmt::format("{}", value.get<double>());
    case json::value_t::array:
        result.push_back('[');
        for (size_t i = 0; i < value.size(); i++) {
            if (i > 0) {
                result.push_back(' ');
            }
            result.append(to_text(value[i]));
        }
        result.push_back(']');
        return result;
    case json::value_t::object:
        result.append("map[");
        for (const auto &item : value.items()) {
            if (result.size() > 4) {
                result.push_back(' ');
            }
            result.append(item.key()).append(":").append(to_text(item.value()));
        }
        result.push_back(']');
        return result;
    default:
        return "<invalid>";
    }
}

/**
 * @brief Evaluates the template tree over a document.
 */
class Executor {
public:
    Executor(const std::string &name, std::ostream &output, const json &root)
        : m_name(name), m_output(output)
    {
        m_vars.emplace_back("$", root);
    }

    void
    walk_list(const std::vector<Node> &list, const json &dot);

private:
    const std::string &m_name;
    std::ostream &m_output;
    std::vector<std::pair<std::string, json>> m_vars;

    [[noreturn]] void error(int line, const std::string &msg) const;

    void write(const std::string &text);
    void pop_vars(size_t mark) { m_vars.erase(m_vars.begin() + mark, m_vars.end()); }

    void walk(const Node &node, const json &dot);
    void walk_range(const Node &node, const json &dot);

    json eval_pipeline(const Pipeline &pipe, const json &dot, bool declare);
    json eval_command(const Command &cmd, const json &dot, const json *final, int line);
    json eval_operand(const Operand &op, const json &dot, int line);
    json eval_fields(const json &value, const std::vector<std::string> &fields, int line);
    const json &lookup(const std::string &name, int line) const;

    json call(const std::string &fn, const Command &cmd, const json &dot, const json *final, int line);
    bool equal(const json &lhs, const json &rhs, int line) const;
    bool less(const json &lhs, const json &rhs, int line) const;
    json index(const std::vector<json> &args, int line) const;
    std::string format(const std::vector<json> &args, int line) const;
};

void
Executor::error(int line, const std::string &msg) const
{
    throw TemplateExecError("template: {}:{}: executing \"{}\": {}", m_name, line, m_name, msg);
}

void
Executor::write(const std::string &text)
{
    m_output.write(text.data(), text.size());
    if (!m_output) {
        throw WriteError("failed to write template output");
    }
}

void
Executor::walk_list(const std::vector<Node> &list, const json &dot)
{
    for (const auto &node : list) {
        walk(node, dot);
    }
}

void
Executor::walk(const Node &node, const json &dot)
{
    const size_t mark = m_vars.size();

    switch (node.type) {
    case NodeType::text:
        write(node.text);
        return;
    case NodeType::action: {
        const json value = eval_pipeline(node.pipe, dot, true);
        if (node.pipe.decl.empty()) {
            write(to_text(value, false));
        }
        return;
    }
    case NodeType::if_block: {
        const json value = eval_pipeline(node.pipe, dot, true);
        walk_list(is_true(value) ? node.list : node.else_list, dot);
        break;
    }
    case NodeType::with_block: {
        const json value = eval_pipeline(node.pipe, dot, true);
        if (is_true(value)) {
            walk_list(node.list, value);
        } else {
            walk_list(node.else_list, dot);
        }
        break;
    }
    case NodeType::range_block:
        walk_range(node, dot);
        break;
    }

    pop_vars(mark);
}

void
Executor::walk_range(const Node &node, const json &dot)
{
    const json value = eval_pipeline(node.pipe, dot, false);
    const std::vector<std::string> &decl = node.pipe.decl;

    auto each = [&](const json &key, const json &elem) {
        const size_t mark = m_vars.size();

        if (decl.size() == 1) {
            m_vars.emplace_back(decl[0], elem);
        } else if (decl.size() == 2) {
            m_vars.emplace_back(decl[0], key);
            m_vars.emplace_back(decl[1], elem);
        }

        walk_list(node.list, elem);
        pop_vars(mark);
    };

    switch (value.type()) {
    case json::value_t::null:
        walk_list(node.else_list, dot);
        return;
    case json::value_t::array:
        for (size_t i = 0; i < value.size(); i++) {
            each(json(i), value[i]);
        }
        break;
    case json::value_t::object:
        // Keys of objects are sorted
        for (const auto &item : value.items()) {
            each(json(item.key()), item.value());
        }
        break;
    default:
        error(node.line, fmt::format("range can't iterate over {}", to_text(value)));
    }

    if (value.empty()) {
        walk_list(node.else_list, dot);
    }
}

json
Executor::eval_pipeline(const Pipeline &pipe, const json &dot, bool declare)
{
    json value;

    for (size_t i = 0; i < pipe.commands.size(); i++) {
        json result = eval_command(pipe.commands[i], dot, (i > 0) ? &value : nullptr, pipe.line);
        value = std::move(result);
    }

    if (declare) {
        for (const auto &var : pipe.decl) {
            m_vars.emplace_back(var, value);
        }
    }

    return value;
}

json
Executor::eval_command(const Command &cmd, const json &dot, const json *final, int line)
{
    const Operand &first = cmd.operands.front();

    if (first.type == OperandType::function) {
        return call(first.name, cmd, dot, final, line);
    }
    if (cmd.operands.size() > 1 || final != nullptr) {
        error(line, "can't give argument to non-function");
    }

    return eval_operand(first, dot, line);
}

json
Executor::eval_operand(const Operand &op, const json &dot, int line)
{
    switch (op.type) {
    case OperandType::dot:
        return dot;
    case OperandType::field:
        return eval_fields(dot, op.fields, line);
    case OperandType::variable:
        return eval_fields(lookup(op.name, line), op.fields, line);
    case OperandType::literal:
        return op.literal;
    case OperandType::function:
        return call(op.name, Command {{op}}, dot, nullptr, line);
    case OperandType::pipeline:
        return eval_fields(eval_pipeline(*op.pipeline, dot, true), op.fields, line);
    }

    error(line, "invalid operand");
}

json
Executor::eval_fields(const json &value, const std::vector<std::string> &fields, int line)
{
    const json *current = &value;
    std::string path;

    for (const auto &field : fields) {
        path.append(".").append(field);

        if (current->is_object()) {
            auto it = current->find(field);
            if (it == current->end()) {
                error(line, fmt::format("at <{}>: map has no entry for key \"{}\"", path, field));
            }
            current = &(*it);
        } else if (current->is_null()) {
            error(line, fmt::format("at <{}>: nil pointer evaluating {}", path, path));
        } else {
            error(line, fmt::format("at <{}>: can't evaluate field {} in type {}",
                path, field, current->type_name()));
        }
    }

    return *current;
}

const json &
Executor::lookup(const std::string &name, int line) const
{
    for (auto it = m_vars.rbegin(); it != m_vars.rend(); ++it) {
        if (it->first == name) {
            return it->second;
        }
    }

    error(line, fmt::format("undefined variable \"{}\"", name));
}

json
Executor::call(const std::string &fn, const Command &cmd, const json &dot, const json *final, int line)
{
    const size_t argc = cmd.operands.size() - 1 + ((final != nullptr) ? 1 : 0);
    auto arg = [&](size_t i) -> json {
        if (i + 1 < cmd.operands.size()) {
            return eval_operand(cmd.operands[i + 1], dot, line);
        }
        return *final;
    };
    auto want_args = [&](size_t min, size_t max) {
        if (argc < min || argc > max) {
            error(line, fmt::format("wrong number of args for {}: want {} got {}", fn, min, argc));
        }
    };

    // Short-circuit evaluation
    if (fn == "and" || fn == "or") {
        want_args(1, SIZE_MAX);

        json value;
        for (size_t i = 0; i < argc; i++) {
            value = arg(i);
            if (is_true(value) != (fn == "and")) {
                break;
            }
        }
        return value;
    }

    std::vector<json> args;
    for (size_t i = 0; i < argc; i++) {
        args.push_back(arg(i));
    }

    if (fn == "not") {
        want_args(1, 1);
        return !is_true(args[0]);
    }
    if (fn == "len") {
        want_args(1, 1);
        if (args[0].is_string()) {
            return args[0].get_ref<const std::string &>().size();
        }
        if (!args[0].is_array() && !args[0].is_object()) {
            error(line, fmt::format("error calling len: len of type {}", args[0].type_name()));
        }
        return args[0].size();
    }
    if (fn == "index") {
        want_args(1, SIZE_MAX);
        return index(args, line);
    }
    if (fn == "eq") {
        want_args(2, SIZE_MAX);
        for (size_t i = 1; i < args.size(); i++) {
            if (equal(args[0], args[i], line)) {
                return true;
            }
        }
        return false;
    }
    if (fn == "ne") {
        want_args(2, 2);
        return !equal(args[0], args[1], line);
    }
    if (fn == "lt" || fn == "le" || fn == "gt" || fn == "ge") {
        want_args(2, 2);
        const bool lt = less(args[0], args[1], line);
        const bool eq = !lt && equal(args[0], args[1], line);

        if (fn == "lt") {
            return lt;
        } else if (fn == "le") {
            return lt || eq;
        } else if (fn == "gt") {
            return !lt && !eq;
        }
        return !lt;
    }
    if (fn == "print" || fn == "println") {
        std::string result;
        for (size_t i = 0; i < args.size(); i++) {
            if (i > 0 && (fn == "println" || (!args[i].is_string() && !args[i - 1].is_string()))) {
                result.push_back(' ');
            }
            result.append(to_text(args[i]));
        }
        if (fn == "println") {
            result.push_back('\n');
        }
        return result;
    }

    // printf
    want_args(1, SIZE_MAX);
    return format(args, line);
}

bool
Executor::equal(const json &lhs, const json &rhs, int line) const
{
    auto kind = [](const json &value) -> int {
        if (value.is_number()) {
            return 1;
        }
        return static_cast<int>(value.type()) + 2;
    };

    if (lhs.is_structured() || rhs.is_structured()) {
        error(line, "error calling eq: non-comparable type");
    }
    if (!lhs.is_null() && !rhs.is_null() && kind(lhs) != kind(rhs)) {
        error(line, "error calling eq: incompatible types for comparison");
    }

    // Numbers of different representation are compared by value
    return lhs == rhs;
}

bool
Executor::less(const json &lhs, const json &rhs, int line) const
{
    if (lhs.is_number() && rhs.is_number()) {
        if (lhs.is_number_float() || rhs.is_number_float()) {
            return lhs.get<double>() < rhs.get<double>();
        }
        return lhs < rhs;
    }
    if (lhs.is_string() && rhs.is_string()) {
        return lhs.get_ref<const std::string &>() < rhs.get_ref<const std::string &>();
    }

    error(line, "error calling comparison: incompatible types for comparison");
}

json
Executor::index(const std::vector<json> &args, int line) const
{
    json value = args[0];

    for (size_t i = 1; i < args.size(); i++) {
        const json &key = args[i];

        if (value.is_array()) {
            if (!key.is_number_integer()) {
                error(line, fmt::format("error calling index: cannot index slice with type {}", key.type_name()));
            }

            const int64_t idx = key.get<int64_t>();
            if (idx < 0 || static_cast<uint64_t>(idx) >= value.size()) {
                error(line, fmt::format("error calling index: index out of range: {}", idx));
            }
            json item = value[static_cast<size_t>(idx)];
            value = std::move(item);
        } else if (value.is_object()) {
            if (!key.is_string()) {
                error(line, fmt::format("error calling index: value has type {}; should be string", key.type_name()));
            }

            // Missing key gives the zero value
            auto it = value.find(key.get<std::string>());
            json item = (it != value.end()) ? *it : json();
            value = std::move(item);
        } else if (value.is_null()) {
            error(line, "error calling index: index of untyped nil");
        } else {
            error(line, fmt::format("error calling index: can't index item of type {}", value.type_name()));
        }
    }

    return value;
}

std::string
Executor::format(const std::vector<json> &args, int line) const
{
    if (!args[0].is_string()) {
        error(line, fmt::format("error calling printf: format has type {}; should be string", args[0].type_name()));
    }

    const std::string &format = args[0].get_ref<const std::string &>();
    std::string result;
    size_t argi = 1;

    for (size_t i = 0; i < format.size(); i++) {
        if (format[i] != '%') {
            result.push_back(format[i]);
            continue;
        }

        if (++i >= format.size()) {
            result.append("%!(NOVERB)");
            break;
        }
        if (format[i] == '%') {
            result.push_back('%');
            continue;
        }

        bool left = false;
        bool zero = false;
        for (; i < format.size() && (format[i] == '-' || format[i] == '0'); i++) {
            left = left || format[i] == '-';
            zero = zero || format[i] == '0';
        }

        size_t width = 0;
        for (; i < format.size() && std::isdigit(static_cast<unsigned char>(format[i])); i++) {
            width = width * 10 + (format[i] - '0');
        }

        int precision = -1;
        if (i < format.size() && format[i] == '.') {
            precision = 0;
            for (i++; i < format.size() && std::isdigit(static_cast<unsigned char>(format[i])); i++) {
                precision = precision * 10 + (format[i] - '0');
            }
        }

        if (i >= format.size()) {
            result.append("%!(NOVERB)");
            break;
        }

        const char verb = format[i];
        if (argi >= args.size()) {
            result.append(fmt::format("%!{}(MISSING)", verb));
            continue;
        }

        const json &value = args[argi++];
        std::string text;

        switch (verb) {
        case 's':
        case 'v':
            text = to_text(value);
            break;
        case 'd':
            if (value.is_number_integer()) {
                text = to_text(value);
            } else if (value.is_number_float() && value.get<double>() == static_cast<double>(value.get<int64_t>())) {
                text = std::to_string(value.get<int64_t>());
            } else {
                text = fmt::format("%!d({}={})", value.type_name(), to_text(value));
            }
            break;
        case 'f':
        case 'e':
        case 'g':
            if (value.is_number()) {
                char buffer[512];
                const std::string spec = fmt::format("%.{}{}", (precision >= 0) ? precision : 6, verb);
                std::snprintf(buffer, sizeof(buffer), spec.c_str(), value.get<double>());
                text = buffer;
            } else {
                text = fmt::format("%!{}({}={})", verb, value.type_name(), to_text(value));
            }
            break;
        case 'q':
            if (value.is_string()) {
                text = value.dump();
            } else {
                text = fmt::format("%!q({}={})", value.type_name(), to_text(value));
            }
            break;
        case 't':
            if (value.is_boolean()) {
                text = to_text(value);
            } else {
                text = fmt::format("%!t({}={})", value.type_name(), to_text(value));
            }
            break;
        default:
            text = fmt::format("%!{}({}={})", verb, value.type_name(), to_text(value));
            break;
        }

        const size_t length = utf8_length(text);
        if (length < width) {
            const size_t missing = width - length;
            if (left) {
                text.append(missing, ' ');
            } else {
                text.insert(0, missing, (zero && value.is_number()) ? '0' : ' ');
            }
        }
        result.append(text);
    }

    if (argi < args.size()) {
        std::vector<std::string> extra;
        for (; argi < args.size(); argi++) {
            extra.push_back(fmt::format("{}={}", args[argi].type_name(), to_text(args[argi])));
        }
        result.append("%!(EXTRA ").append(string_join(extra, ", ")).append(")");
    }

    return result;
}

} // tmpl

struct Template::Tree {
    std::vector<tmpl::Node> root;
};

Template::Template(const std::string &name, const std::string &text)
    : m_name(name), m_tree(new Tree())
{
    tmpl::Lexer lexer {m_name, text};
    tmpl::Parser parser {m_name, lexer.run()};

    m_tree->root = parser.parse();
}

Template::~Template() = default;

Template::Template(Template &&other) noexcept = default;

Template &Template::operator=(Template &&other) noexcept = default;

void
Template::execute(std::ostream &output, const nlohmann::json &data) const
{
    tmpl::Executor executor {m_name, output, data};

    executor.walk_list(m_tree->root, data);
}

} // printer
} // resprint
