#pragma once
#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "token.hpp"

// Base class for all AST nodes
struct Node {
    virtual ~Node() = default;
    Token token;  // filename, line, column for this node (set by the parser)

    virtual std::string to_string() const {
        return "<node>";
    }
};

// Expressions
struct ExpressionNode : public Node {
    virtual std::unique_ptr<ExpressionNode> clone() const = 0;
};

// Statements
struct StatementNode : public Node {
    virtual std::unique_ptr<StatementNode> clone() const = 0;
};

// Brace-delimited statement list. Its value is the value of the last
// expression statement it runs.
struct BlockNode : public Node {
    std::vector<std::unique_ptr<StatementNode>> body;

    std::unique_ptr<BlockNode> clone() const {
        auto n = std::make_unique<BlockNode>();
        n->token = token;
        n->body.reserve(body.size());
        for (const auto& s : body) n->body.push_back(s ? s->clone() : nullptr);
        return n;
    }

    std::string to_string() const override {
        std::string s = "{ ";
        for (const auto& st : body) {
            if (st) s += st->to_string() + " ";
        }
        return s + "}";
    }
};

// ============================================================================
// LITERALS
// ============================================================================

// Digits are kept verbatim; `is_big` is set when they do not fit in int64.
struct IntegerLiteralNode : public ExpressionNode {
    std::string digits;
    int64_t value = 0;
    bool is_big = false;

    std::string to_string() const override {
        return digits;
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<IntegerLiteralNode>();
        n->digits = digits;
        n->value = value;
        n->is_big = is_big;
        n->token = token;
        return n;
    }
};

struct StringLiteralNode : public ExpressionNode {
    std::string value;
    std::string to_string() const override {
        std::string out = "\"";
        for (char c : value) {
            switch (c) {
                case '\n': out += "\\n"; break;
                case '\t': out += "\\t"; break;
                case '\r': out += "\\r"; break;
                case '\0': out += "\\0"; break;
                case '"': out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                default: out.push_back(c);
            }
        }
        return out + "\"";
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<StringLiteralNode>();
        n->value = value;
        n->token = token;
        return n;
    }
};

struct BooleanLiteralNode : public ExpressionNode {
    bool value = false;
    std::string to_string() const override {
        return value ? "true" : "false";
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<BooleanLiteralNode>();
        n->value = value;
        n->token = token;
        return n;
    }
};

struct NullNode : public ExpressionNode {
    std::string to_string() const override { return "null"; }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<NullNode>();
        n->token = token;
        return n;
    }
};

struct IdentifierNode : public ExpressionNode {
    std::string name;
    std::string to_string() const override {
        return name;
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<IdentifierNode>();
        n->name = name;
        n->token = token;
        return n;
    }
};

struct ThisExpressionNode : public ExpressionNode {
    std::string to_string() const override { return "this"; }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<ThisExpressionNode>();
        n->token = token;
        return n;
    }
};

// ============================================================================
// OPERATORS
// ============================================================================

struct UnaryExpressionNode : public ExpressionNode {
    std::string op;  // "!" or "-"
    std::unique_ptr<ExpressionNode> operand;
    std::string to_string() const override {
        std::string opnd = operand ? operand->to_string() : "<null>";
        return "(" + op + opnd + ")";
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<UnaryExpressionNode>();
        n->op = op;
        n->token = token;
        if (operand) n->operand = operand->clone();
        return n;
    }
};

struct BinaryExpressionNode : public ExpressionNode {
    std::string op;  // e.g. "+", "*", "==", "&&"
    std::unique_ptr<ExpressionNode> left;
    std::unique_ptr<ExpressionNode> right;
    std::string to_string() const override {
        std::string l = left ? left->to_string() : "<null>";
        std::string r = right ? right->to_string() : "<null>";
        return "(" + l + " " + op + " " + r + ")";
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<BinaryExpressionNode>();
        n->op = op;
        n->token = token;
        if (left) n->left = left->clone();
        if (right) n->right = right->clone();
        return n;
    }
};

// Assignment: target is an IdentifierNode, IndexExpressionNode or MemberExpressionNode
struct AssignmentExpressionNode : public ExpressionNode {
    std::unique_ptr<ExpressionNode> target;
    std::unique_ptr<ExpressionNode> value;

    std::string to_string() const override {
        std::string t = target ? target->to_string() : "<null>";
        std::string v = value ? value->to_string() : "<null>";
        return "(" + t + " = " + v + ")";
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<AssignmentExpressionNode>();
        n->token = token;
        n->target = target ? target->clone() : nullptr;
        n->value = value ? value->clone() : nullptr;
        return n;
    }
};

// ============================================================================
// POSTFIX
// ============================================================================

struct CallExpressionNode : public ExpressionNode {
    std::unique_ptr<ExpressionNode> callee;
    std::vector<std::unique_ptr<ExpressionNode>> arguments;

    std::string to_string() const override {
        std::string c = callee ? callee->to_string() : "<null>";
        std::string args;
        for (size_t i = 0; i < arguments.size(); ++i) {
            if (i) args += ", ";
            args += arguments[i] ? arguments[i]->to_string() : "<null>";
        }
        return c + "(" + args + ")";
    }

    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<CallExpressionNode>();
        n->token = token;
        if (callee) n->callee = callee->clone();
        n->arguments.reserve(arguments.size());
        for (const auto& a : arguments) n->arguments.push_back(a ? a->clone() : nullptr);
        return n;
    }
};

// obj[index]
struct IndexExpressionNode : public ExpressionNode {
    std::unique_ptr<ExpressionNode> object;
    std::unique_ptr<ExpressionNode> index;

    std::string to_string() const override {
        std::string o = object ? object->to_string() : "<null>";
        std::string i = index ? index->to_string() : "<null>";
        return "(" + o + "[" + i + "])";
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<IndexExpressionNode>();
        n->token = token;
        if (object) n->object = object->clone();
        if (index) n->index = index->clone();
        return n;
    }
};

// obj.property
struct MemberExpressionNode : public ExpressionNode {
    std::unique_ptr<ExpressionNode> object;
    std::string property;

    std::string to_string() const override {
        std::string o = object ? object->to_string() : "<null>";
        return o + "." + property;
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<MemberExpressionNode>();
        n->token = token;
        n->property = property;
        if (object) n->object = object->clone();
        return n;
    }
};

// ============================================================================
// COMPOSITE LITERALS
// ============================================================================

struct ArrayExpressionNode : public ExpressionNode {
    std::vector<std::unique_ptr<ExpressionNode>> elements;

    std::string to_string() const override {
        std::string s = "[";
        for (size_t i = 0; i < elements.size(); ++i) {
            if (i) s += ", ";
            s += elements[i] ? elements[i]->to_string() : "<null>";
        }
        return s + "]";
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<ArrayExpressionNode>();
        n->token = token;
        n->elements.reserve(elements.size());
        for (const auto& e : elements) n->elements.push_back(e ? e->clone() : nullptr);
        return n;
    }
};

// { key: value, ... }
struct HashMapExpressionNode : public ExpressionNode {
    std::vector<std::pair<std::unique_ptr<ExpressionNode>, std::unique_ptr<ExpressionNode>>> entries;

    std::string to_string() const override {
        std::string s = "{";
        for (size_t i = 0; i < entries.size(); ++i) {
            if (i) s += ", ";
            s += entries[i].first->to_string() + ": " + entries[i].second->to_string();
        }
        return s + "}";
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<HashMapExpressionNode>();
        n->token = token;
        n->entries.reserve(entries.size());
        for (const auto& e : entries) {
            n->entries.emplace_back(e.first->clone(), e.second->clone());
        }
        return n;
    }
};

struct FieldInitializer {
    std::string name;
    std::unique_ptr<ExpressionNode> value;
    Token token;
};

// Name { field: value, ... }
struct StructLiteralNode : public ExpressionNode {
    std::string struct_name;
    std::vector<FieldInitializer> fields;

    std::string to_string() const override {
        std::string s = struct_name + " {";
        for (size_t i = 0; i < fields.size(); ++i) {
            s += (i ? ", " : " ") + fields[i].name + ": " + fields[i].value->to_string();
        }
        return s + " }";
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<StructLiteralNode>();
        n->token = token;
        n->struct_name = struct_name;
        n->fields.reserve(fields.size());
        for (const auto& f : fields) {
            n->fields.push_back(FieldInitializer{f.name, f.value->clone(), f.token});
        }
        return n;
    }
};

// fn(a, b) { ... }. `name` is set by the `fn name(...)` statement form.
// The body is shared with every function value created from this literal,
// so it outlives the program that declared it (REPL lines, imported modules).
struct FunctionExpressionNode : public ExpressionNode {
    std::string name;
    std::vector<std::string> parameters;
    std::shared_ptr<BlockNode> body;

    std::string to_string() const override {
        std::string s = "fn";
        if (!name.empty()) s += " " + name;
        s += "(";
        for (size_t i = 0; i < parameters.size(); ++i) {
            if (i) s += ", ";
            s += parameters[i];
        }
        return s + ") " + (body ? body->to_string() : "{ }");
    }
    std::unique_ptr<FunctionExpressionNode> clone_function() const {
        auto n = std::make_unique<FunctionExpressionNode>();
        n->token = token;
        n->name = name;
        n->parameters = parameters;
        n->body = body;
        return n;
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        return clone_function();
    }
};

// if (cond) { ... } else { ... }. An `else if` is an else block holding
// a single expression statement with the nested IfExpressionNode.
struct IfExpressionNode : public ExpressionNode {
    std::unique_ptr<ExpressionNode> condition;
    std::unique_ptr<BlockNode> then_block;
    std::unique_ptr<BlockNode> else_block;  // optional

    std::string to_string() const override {
        std::string s = "if " + (condition ? condition->to_string() : "<null>") + " " +
            (then_block ? then_block->to_string() : "{ }");
        if (else_block) s += " else " + else_block->to_string();
        return s;
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<IfExpressionNode>();
        n->token = token;
        n->condition = condition ? condition->clone() : nullptr;
        n->then_block = then_block ? then_block->clone() : nullptr;
        n->else_block = else_block ? else_block->clone() : nullptr;
        return n;
    }
};

// ============================================================================
// STATEMENTS
// ============================================================================

struct LetStatementNode : public StatementNode {
    std::string identifier;
    std::unique_ptr<ExpressionNode> value;

    std::string to_string() const override {
        return "let " + identifier + " = " + (value ? value->to_string() : "<null>") + ";";
    }
    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<LetStatementNode>();
        n->token = token;
        n->identifier = identifier;
        n->value = value ? value->clone() : nullptr;
        return n;
    }
};

struct ExpressionStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> expression;

    std::string to_string() const override {
        return expression ? expression->to_string() : "<null>";
    }
    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<ExpressionStatementNode>();
        n->token = token;
        n->expression = expression ? expression->clone() : nullptr;
        return n;
    }
};

struct ReturnStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> value;  // optional

    std::string to_string() const override {
        return value ? "return " + value->to_string() + ";" : "return;";
    }
    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<ReturnStatementNode>();
        n->token = token;
        n->value = value ? value->clone() : nullptr;
        return n;
    }
};

struct BreakStatementNode : public StatementNode {
    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<BreakStatementNode>();
        n->token = token;
        return n;
    }

    std::string to_string() const override {
        return "break;";
    }
};

struct ContinueStatementNode : public StatementNode {
    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<ContinueStatementNode>();
        n->token = token;
        return n;
    }

    std::string to_string() const override {
        return "continue;";
    }
};

struct WhileStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> condition;
    std::unique_ptr<BlockNode> body;

    std::string to_string() const override {
        return "while " + condition->to_string() + " " + body->to_string();
    }
    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<WhileStatementNode>();
        n->token = token;
        n->condition = condition ? condition->clone() : nullptr;
        n->body = body ? body->clone() : nullptr;
        return n;
    }
};

// for (x in iterable) { ... }
struct ForInStatementNode : public StatementNode {
    std::string variable;
    std::unique_ptr<ExpressionNode> iterable;
    std::unique_ptr<BlockNode> body;

    std::string to_string() const override {
        return "for (" + variable + " in " + iterable->to_string() + ") " + body->to_string();
    }
    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<ForInStatementNode>();
        n->token = token;
        n->variable = variable;
        n->iterable = iterable ? iterable->clone() : nullptr;
        n->body = body ? body->clone() : nullptr;
        return n;
    }
};

// for (init; condition; post) { ... } -- every clause optional
struct ForStatementNode : public StatementNode {
    std::unique_ptr<StatementNode> init;
    std::unique_ptr<ExpressionNode> condition;
    std::unique_ptr<ExpressionNode> post;
    std::unique_ptr<BlockNode> body;

    std::string to_string() const override {
        return "for (" + (init ? init->to_string() : std::string(";")) + " " +
            (condition ? condition->to_string() : "") + "; " +
            (post ? post->to_string() : "") + ") " + body->to_string();
    }
    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<ForStatementNode>();
        n->token = token;
        n->init = init ? init->clone() : nullptr;
        n->condition = condition ? condition->clone() : nullptr;
        n->post = post ? post->clone() : nullptr;
        n->body = body ? body->clone() : nullptr;
        return n;
    }
};

struct StructFieldNode {
    std::string name;
    std::unique_ptr<ExpressionNode> default_value;
    Token token;
};

struct StructMethodNode {
    std::string name;
    std::unique_ptr<FunctionExpressionNode> function;
    Token token;
};

// struct Name { field: default, method: fn(...) { ... } }
struct StructDeclarationNode : public StatementNode {
    std::string name;
    std::vector<StructFieldNode> fields;
    std::vector<StructMethodNode> methods;

    std::string to_string() const override {
        std::ostringstream ss;
        ss << "struct " << name << " {";
        bool first = true;
        for (const auto& f : fields) {
            ss << (first ? " " : ", ") << f.name << ": " << f.default_value->to_string();
            first = false;
        }
        for (const auto& m : methods) {
            ss << (first ? " " : ", ") << m.name << ": " << m.function->to_string();
            first = false;
        }
        ss << " }";
        return ss.str();
    }
    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<StructDeclarationNode>();
        n->token = token;
        n->name = name;
        for (const auto& f : fields) {
            n->fields.push_back(StructFieldNode{f.name, f.default_value->clone(), f.token});
        }
        for (const auto& m : methods) {
            n->methods.push_back(StructMethodNode{m.name, m.function->clone_function(), m.token});
        }
        return n;
    }
};

// import a.b;  /  import a.b.{x, y};
struct ImportDeclarationNode : public StatementNode {
    std::vector<std::string> path;  // dotted segments
    std::vector<std::string> names;  // selected names; empty means every binding
    std::vector<Token> name_tokens;

    std::string module_name() const {
        std::string s;
        for (size_t i = 0; i < path.size(); ++i) {
            if (i) s += "::";
            s += path[i];
        }
        return s;
    }

    std::string to_string() const override {
        std::string s = "import ";
        for (size_t i = 0; i < path.size(); ++i) {
            if (i) s += ".";
            s += path[i];
        }
        if (!names.empty()) {
            s += ".{";
            for (size_t i = 0; i < names.size(); ++i) {
                if (i) s += ", ";
                s += names[i];
            }
            s += "}";
        }
        return s + ";";
    }
    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<ImportDeclarationNode>();
        n->token = token;
        n->path = path;
        n->names = names;
        n->name_tokens = name_tokens;
        return n;
    }
};

// Program root
struct ProgramNode : public Node {
    std::vector<std::unique_ptr<StatementNode>> body;

    std::string to_string() const override {
        std::string s;
        for (const auto& st : body) {
            if (!st) continue;
            if (!s.empty()) s += "\n";
            s += st->to_string();
        }
        return s;
    }
};
