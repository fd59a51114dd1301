#include "core/debug/evaluator.h"

#include <cmath>
#include <limits>

#include <QtNumeric>

struct ExprNode {
    enum Kind {
        Literal,
        Name,
        Member,
        Index,
        Deref,
        Unary,
        Binary
    } kind = Literal;
    Value literal;
    QString name;   // Name, Member
    QString op;     // Unary, Binary
    std::shared_ptr<const ExprNode> lhs, rhs;
    std::vector<std::shared_ptr<const ExprNode>> indices;
};

namespace {

using NodePtr = std::shared_ptr<const ExprNode>;

bool isIdentStart(QChar c)
{
    return c.isLetter() || c == QLatin1Char('_');
}

bool isIdentChar(QChar c)
{
    return c.isLetterOrNumber() || c == QLatin1Char('_');
}

NodePtr makeLiteral(const Value &value)
{
    auto node = std::make_shared<ExprNode>();
    node->kind = ExprNode::Literal;
    node->literal = value;
    return node;
}

NodePtr makeBinary(const QString &op, NodePtr lhs, NodePtr rhs)
{
    auto node = std::make_shared<ExprNode>();
    node->kind = ExprNode::Binary;
    node->op = op;
    node->lhs = std::move(lhs);
    node->rhs = std::move(rhs);
    return node;
}

NodePtr makeUnary(const QString &op, NodePtr operand)
{
    auto node = std::make_shared<ExprNode>();
    node->kind = ExprNode::Unary;
    node->op = op;
    node->lhs = std::move(operand);
    return node;
}

class Parser
{
public:
    Parser(const QString &text, const TypeRegistry &types)
        : m_text(text), m_types(types)
    {}

    NodePtr parse()
    {
        NodePtr root = parseOr();
        if (!root)
            return nullptr;
        skipSpace();
        if (!atEnd()) {
            fail(QStringLiteral("unexpected '%1' at column %2").arg(m_text.at(m_pos)).arg(m_pos));
            return nullptr;
        }
        return root;
    }

    QString error() const { return m_error; }

private:
    void skipSpace()
    {
        while (m_pos < m_text.size() && m_text.at(m_pos).isSpace())
            ++m_pos;
    }

    bool atEnd() const { return m_pos >= m_text.size(); }

    QChar peek(int ahead = 0) const
    {
        const int at = m_pos + ahead;
        return at < m_text.size() ? m_text.at(at) : QChar();
    }

    bool matchSymbol(const char *symbol)
    {
        skipSpace();
        const QLatin1String sym(symbol);
        if (QStringView(m_text).mid(m_pos).left(sym.size()) != sym)
            return false;
        m_pos += sym.size();
        return true;
    }

    bool peekKeyword(const char *keyword)
    {
        skipSpace();
        const QLatin1String kw(keyword);
        if (QStringView(m_text).mid(m_pos).left(kw.size()).compare(kw, Qt::CaseInsensitive) != 0)
            return false;
        return !isIdentChar(peek(kw.size()));
    }

    bool matchKeyword(const char *keyword)
    {
        if (!peekKeyword(keyword))
            return false;
        m_pos += int(qstrlen(keyword));
        return true;
    }

    QString readIdent()
    {
        const int start = m_pos;
        while (!atEnd() && isIdentChar(peek()))
            ++m_pos;
        return m_text.mid(start, m_pos - start);
    }

    QString readDigits(int base)
    {
        QString digits;
        while (!atEnd()) {
            const QChar c = peek();
            if (c == QLatin1Char('_')) {
                ++m_pos;
                continue;
            }
            bool ok = false;
            const int digit = QString(c).toInt(&ok, 16);
            if (!ok || digit >= base)
                break;
            digits += c;
            ++m_pos;
        }
        return digits;
    }

    NodePtr fail(const QString &message)
    {
        if (m_error.isEmpty())
            m_error = message;
        return nullptr;
    }

    NodePtr parseOr()
    {
        NodePtr lhs = parseXor();
        while (lhs && matchKeyword("OR")) {
            NodePtr rhs = parseXor();
            if (!rhs)
                return nullptr;
            lhs = makeBinary(QStringLiteral("OR"), lhs, rhs);
        }
        return lhs;
    }

    NodePtr parseXor()
    {
        NodePtr lhs = parseAnd();
        while (lhs && matchKeyword("XOR")) {
            NodePtr rhs = parseAnd();
            if (!rhs)
                return nullptr;
            lhs = makeBinary(QStringLiteral("XOR"), lhs, rhs);
        }
        return lhs;
    }

    NodePtr parseAnd()
    {
        NodePtr lhs = parseComparison();
        while (lhs && (matchKeyword("AND") || matchSymbol("&"))) {
            NodePtr rhs = parseComparison();
            if (!rhs)
                return nullptr;
            lhs = makeBinary(QStringLiteral("AND"), lhs, rhs);
        }
        return lhs;
    }

    NodePtr parseComparison()
    {
        static const char *const ops[] = { "<>", "<=", ">=", "=", "<", ">" };
        NodePtr lhs = parseAdditive();
        while (lhs) {
            const char *matched = nullptr;
            for (const char *op : ops) {
                if (matchSymbol(op)) {
                    matched = op;
                    break;
                }
            }
            if (!matched)
                break;
            NodePtr rhs = parseAdditive();
            if (!rhs)
                return nullptr;
            lhs = makeBinary(QLatin1String(matched), lhs, rhs);
        }
        return lhs;
    }

    NodePtr parseAdditive()
    {
        NodePtr lhs = parseMultiplicative();
        while (lhs) {
            QString op;
            if (matchSymbol("+"))
                op = QStringLiteral("+");
            else if (matchSymbol("-"))
                op = QStringLiteral("-");
            else
                break;
            NodePtr rhs = parseMultiplicative();
            if (!rhs)
                return nullptr;
            lhs = makeBinary(op, lhs, rhs);
        }
        return lhs;
    }

    NodePtr parseMultiplicative()
    {
        NodePtr lhs = parsePower();
        while (lhs) {
            QString op;
            skipSpace();
            if (peek() == QLatin1Char('*') && peek(1) != QLatin1Char('*') && matchSymbol("*"))
                op = QStringLiteral("*");
            else if (matchSymbol("/"))
                op = QStringLiteral("/");
            else if (matchKeyword("MOD"))
                op = QStringLiteral("MOD");
            else
                break;
            NodePtr rhs = parsePower();
            if (!rhs)
                return nullptr;
            lhs = makeBinary(op, lhs, rhs);
        }
        return lhs;
    }

    NodePtr parsePower()
    {
        NodePtr lhs = parseUnary();
        while (lhs && matchSymbol("**")) {
            NodePtr rhs = parseUnary();
            if (!rhs)
                return nullptr;
            lhs = makeBinary(QStringLiteral("**"), lhs, rhs);
        }
        return lhs;
    }

    NodePtr parseUnary()
    {
        if (matchKeyword("NOT")) {
            NodePtr operand = parseUnary();
            return operand ? makeUnary(QStringLiteral("NOT"), operand) : nullptr;
        }
        if (matchSymbol("-")) {
            NodePtr operand = parseUnary();
            return operand ? makeUnary(QStringLiteral("-"), operand) : nullptr;
        }
        if (matchSymbol("+"))
            return parseUnary();
        return parsePostfix();
    }

    NodePtr parsePostfix()
    {
        NodePtr base = parsePrimary();
        while (base) {
            if (matchSymbol(".")) {
                skipSpace();
                if (!isIdentStart(peek()))
                    return fail(QStringLiteral("expected member name after '.'"));
                auto node = std::make_shared<ExprNode>();
                node->kind = ExprNode::Member;
                node->lhs = base;
                node->name = readIdent();
                base = node;
            } else if (matchSymbol("[")) {
                auto node = std::make_shared<ExprNode>();
                node->kind = ExprNode::Index;
                node->lhs = base;
                do {
                    NodePtr index = parseOr();
                    if (!index)
                        return nullptr;
                    node->indices.push_back(index);
                } while (matchSymbol(","));
                if (!matchSymbol("]"))
                    return fail(QStringLiteral("expected ']'"));
                base = node;
            } else if (matchSymbol("^")) {
                auto node = std::make_shared<ExprNode>();
                node->kind = ExprNode::Deref;
                node->lhs = base;
                base = node;
            } else {
                break;
            }
        }
        return base;
    }

    NodePtr parsePrimary()
    {
        skipSpace();
        if (atEnd())
            return fail(QStringLiteral("unexpected end of expression"));

        const QChar c = peek();
        if (c == QLatin1Char('(')) {
            ++m_pos;
            NodePtr inner = parseOr();
            if (!inner)
                return nullptr;
            if (!matchSymbol(")"))
                return fail(QStringLiteral("expected ')'"));
            return inner;
        }
        if (c == QLatin1Char('\'') || c == QLatin1Char('"')) {
            Value text;
            if (!parseString(&text))
                return nullptr;
            return makeLiteral(text);
        }
        if (c.isDigit()) {
            Value number;
            if (!parseNumber(&number))
                return nullptr;
            return makeLiteral(number);
        }
        if (!isIdentStart(c))
            return fail(QStringLiteral("unexpected '%1' at column %2").arg(c).arg(m_pos));

        const QString ident = readIdent();
        const QString upper = ident.toUpper();
        if (upper == QLatin1String("TRUE"))
            return makeLiteral(Value::fromBool(true));
        if (upper == QLatin1String("FALSE"))
            return makeLiteral(Value::fromBool(false));

        if (peek() == QLatin1Char('#')) {
            ++m_pos;
            return parsePrefixedLiteral(upper);
        }

        auto node = std::make_shared<ExprNode>();
        node->kind = ExprNode::Name;
        node->name = ident;
        return node;
    }

    // <prefix>#... : durations, typed literals and enum literals.
    NodePtr parsePrefixedLiteral(const QString &prefix)
    {
        if (prefix == QLatin1String("T") || prefix == QLatin1String("TIME")
            || prefix == QLatin1String("LT") || prefix == QLatin1String("LTIME")) {
            qint64 ns = 0;
            if (!parseDuration(&ns))
                return nullptr;
            return makeLiteral(Value::fromTimeNs(ns));
        }

        ValueType type;
        if (parseValueTypeName(prefix, &type)) {
            Value raw;
            if (type == ValueType::String || type == ValueType::WString) {
                if (peek() != QLatin1Char('\'') && peek() != QLatin1Char('"'))
                    return fail(QStringLiteral("expected string after '%1#'").arg(prefix));
                if (!parseString(&raw))
                    return nullptr;
            } else if (isIdentStart(peek())) {
                const QString word = readIdent().toUpper();
                if (word == QLatin1String("TRUE"))
                    raw = Value::fromBool(true);
                else if (word == QLatin1String("FALSE"))
                    raw = Value::fromBool(false);
                else
                    return fail(QStringLiteral("invalid %1 literal").arg(prefix));
            } else {
                const bool negative = peek() == QLatin1Char('-');
                if (negative || peek() == QLatin1Char('+'))
                    ++m_pos;
                if (!peek().isDigit())
                    return fail(QStringLiteral("invalid %1 literal").arg(prefix));
                if (!parseNumber(&raw))
                    return nullptr;
                if (negative) {
                    if (raw.isReal())
                        raw = Value::fromReal(raw.type(), -raw.toReal());
                    else if (raw.isUnsigned() && raw.toUInt() > quint64(std::numeric_limits<qint64>::max()))
                        return fail(QStringLiteral("value out of range for %1").arg(prefix));
                    else
                        raw = Value::fromInt(ValueType::LInt, -raw.toInt());
                }
            }
            Value typed;
            QString error;
            if (!coerceValue(raw, type, &typed, &error))
                return fail(error);
            return makeLiteral(typed);
        }

        const EnumType *enumType = m_types.findEnum(prefix);
        if (!enumType)
            return fail(QStringLiteral("unknown enum type '%1'").arg(prefix));
        if (!isIdentStart(peek()))
            return fail(QStringLiteral("expected enum value after '%1#'").arg(prefix));
        const QString variant = readIdent();
        for (int i = 0; i < enumType->variants.size(); ++i) {
            if (enumType->variants.at(i).compare(variant, Qt::CaseInsensitive) == 0)
                return makeLiteral(Value::fromEnum(enumType->name, enumType->variants.at(i), i));
        }
        return fail(QStringLiteral("unknown enum value '%1#%2'").arg(enumType->name, variant));
    }

    bool parseString(Value *out)
    {
        const QChar quote = peek();
        const bool wide = quote == QLatin1Char('"');
        ++m_pos;
        QString text;
        while (!atEnd()) {
            const QChar c = peek();
            ++m_pos;
            if (c == quote) {
                *out = Value::fromString(text, wide);
                return true;
            }
            if (c == QLatin1Char('$') && !atEnd()) {
                const QChar esc = peek().toUpper();
                ++m_pos;
                if (esc == QLatin1Char('N') || esc == QLatin1Char('L'))
                    text += QLatin1Char('\n');
                else if (esc == QLatin1Char('R'))
                    text += QLatin1Char('\r');
                else if (esc == QLatin1Char('T'))
                    text += QLatin1Char('\t');
                else
                    text += m_text.at(m_pos - 1);
                continue;
            }
            text += c;
        }
        fail(QStringLiteral("unterminated string literal"));
        return false;
    }

    bool parseNumber(Value *out)
    {
        const QString digits = readDigits(10);
        if (peek() == QLatin1Char('#')) {
            const int base = digits.toInt();
            if (base != 2 && base != 8 && base != 16) {
                fail(QStringLiteral("unsupported number base %1").arg(digits));
                return false;
            }
            ++m_pos;
            const QString based = readDigits(base);
            bool ok = false;
            const quint64 value = based.toULongLong(&ok, base);
            if (based.isEmpty() || !ok) {
                fail(QStringLiteral("invalid based literal"));
                return false;
            }
            *out = integerLiteral(value);
            return true;
        }

        QString real = digits;
        bool isReal = false;
        if (peek() == QLatin1Char('.') && peek(1).isDigit()) {
            ++m_pos;
            real += QLatin1Char('.') + readDigits(10);
            isReal = true;
        }
        if (peek().toLower() == QLatin1Char('e')
            && (peek(1).isDigit() || ((peek(1) == QLatin1Char('-') || peek(1) == QLatin1Char('+')) && peek(2).isDigit()))) {
            real += QLatin1Char('e');
            ++m_pos;
            if (peek() == QLatin1Char('-') || peek() == QLatin1Char('+')) {
                real += peek();
                ++m_pos;
            }
            real += readDigits(10);
            isReal = true;
        }

        bool ok = false;
        if (isReal) {
            const double value = real.toDouble(&ok);
            if (!ok) {
                fail(QStringLiteral("invalid real literal '%1'").arg(real));
                return false;
            }
            *out = Value::fromReal(ValueType::LReal, value);
            return true;
        }
        const quint64 value = digits.toULongLong(&ok);
        if (!ok) {
            fail(QStringLiteral("integer literal '%1' out of range").arg(digits));
            return false;
        }
        *out = integerLiteral(value);
        return true;
    }

    static Value integerLiteral(quint64 value)
    {
        if (value <= quint64(std::numeric_limits<qint32>::max()))
            return Value::fromInt(ValueType::DInt, qint64(value));
        if (value <= quint64(std::numeric_limits<qint64>::max()))
            return Value::fromInt(ValueType::LInt, qint64(value));
        return Value::fromUInt(ValueType::ULInt, value);
    }

    bool parseDuration(qint64 *out)
    {
        bool negative = false;
        if (peek() == QLatin1Char('-')) {
            negative = true;
            ++m_pos;
        }

        double total = 0.0;
        int parts = 0;
        while (peek().isDigit()) {
            QString number = readDigits(10);
            if (peek() == QLatin1Char('.') && peek(1).isDigit()) {
                ++m_pos;
                number += QLatin1Char('.') + readDigits(10);
            }
            QString unit;
            while (!atEnd() && peek().isLetter())
                unit += m_text.at(m_pos++);
            unit = unit.toLower();

            double scale = 0.0;
            if (unit == QLatin1String("d"))
                scale = 86400e9;
            else if (unit == QLatin1String("h"))
                scale = 3600e9;
            else if (unit == QLatin1String("m"))
                scale = 60e9;
            else if (unit == QLatin1String("s"))
                scale = 1e9;
            else if (unit == QLatin1String("ms"))
                scale = 1e6;
            else if (unit == QLatin1String("us"))
                scale = 1e3;
            else if (unit == QLatin1String("ns"))
                scale = 1.0;
            else {
                fail(QStringLiteral("invalid duration unit '%1'").arg(unit));
                return false;
            }
            total += number.toDouble() * scale;
            ++parts;
            if (peek() == QLatin1Char('_'))
                ++m_pos;
        }
        if (parts == 0) {
            fail(QStringLiteral("invalid duration literal"));
            return false;
        }
        if (total > double(std::numeric_limits<qint64>::max())) {
            fail(QStringLiteral("duration out of range"));
            return false;
        }
        *out = negative ? -qint64(total) : qint64(total);
        return true;
    }

    const QString m_text;
    const TypeRegistry &m_types;
    int m_pos = 0;
    QString m_error;
};

int integerRank(ValueType type)
{
    switch (type) {
    case ValueType::SInt:
    case ValueType::USInt:
    case ValueType::Byte:
        return 1;
    case ValueType::Int:
    case ValueType::UInt:
    case ValueType::Word:
        return 2;
    case ValueType::DInt:
    case ValueType::UDInt:
    case ValueType::DWord:
        return 3;
    default:
        return 4;
    }
}

ValueType signedOfRank(int rank)
{
    static const ValueType types[] = { ValueType::SInt, ValueType::Int, ValueType::DInt, ValueType::LInt };
    return types[qBound(1, rank, 4) - 1];
}

ValueType integerResultType(const Value &a, const Value &b)
{
    const int ra = integerRank(a.type());
    const int rb = integerRank(b.type());
    if (a.isUnsigned() && b.isUnsigned())
        return rb > ra ? b.type() : a.type();
    if (a.isSigned() && b.isSigned())
        return signedOfRank(qMax(ra, rb));
    // Mixed signedness: widen so the unsigned operand's range still fits.
    const int unsignedRank = a.isUnsigned() ? ra : rb;
    const int signedRank = a.isSigned() ? ra : rb;
    return signedOfRank(qMax(signedRank, unsignedRank < 4 ? unsignedRank + 1 : 4));
}

int compareIntegers(const Value &a, const Value &b)
{
    const bool aNegative = a.isSigned() && a.toInt() < 0;
    const bool bNegative = b.isSigned() && b.toInt() < 0;
    if (aNegative != bNegative)
        return aNegative ? -1 : 1;
    if (aNegative) {
        const qint64 x = a.toInt();
        const qint64 y = b.toInt();
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    const quint64 x = a.toUInt();
    const quint64 y = b.toUInt();
    return x < y ? -1 : (x > y ? 1 : 0);
}

class Evaluator
{
public:
    explicit Evaluator(const EvalScope &scope)
        : m_scope(scope)
    {}

    bool eval(const ExprNode &node, Value *out)
    {
        switch (node.kind) {
        case ExprNode::Literal:
            *out = node.literal;
            return true;
        case ExprNode::Name:
            return evalName(node.name, out);
        case ExprNode::Member:
            return evalMember(node, out);
        case ExprNode::Index:
            return evalIndex(node, out);
        case ExprNode::Deref:
            return evalDeref(node, out);
        case ExprNode::Unary:
            return evalUnary(node, out);
        case ExprNode::Binary:
            return evalBinary(node, out);
        }
        return fail(QStringLiteral("type mismatch"));
    }

    QString error() const { return m_error; }

private:
    bool fail(const QString &message)
    {
        if (m_error.isEmpty())
            m_error = message;
        return false;
    }

    bool evalName(const QString &name, Value *out)
    {
        ValueRef ref;
        if (!resolveVariable(m_scope, name, &ref) || !m_scope.storage->readByRef(ref, out))
            return fail(QStringLiteral("unknown identifier '%1'").arg(name));
        return true;
    }

    bool evalMember(const ExprNode &node, Value *out)
    {
        const ExprNode &base = *node.lhs;
        if (base.kind == ExprNode::Name) {
            // Namespace-qualified names: Ns.Var
            ValueRef ref;
            if (!resolveVariable(m_scope, base.name, &ref)) {
                const QString qualified = base.name + QLatin1Char('.') + node.name;
                if (resolveVariable(m_scope, qualified, &ref) && m_scope.storage->readByRef(ref, out))
                    return true;
                return fail(QStringLiteral("unknown identifier '%1'").arg(qualified));
            }
        }

        Value owner;
        if (!eval(base, &owner))
            return false;
        if (owner.type() == ValueType::Struct) {
            const Value *field = owner.field(node.name);
            if (!field)
                return fail(QStringLiteral("unknown field '%1'").arg(node.name));
            *out = *field;
            return true;
        }
        if (owner.type() == ValueType::Instance) {
            const InstanceData *data = m_scope.storage->instance(owner.instanceId());
            const Value *var = data ? data->vars.get(node.name) : nullptr;
            if (!var)
                return fail(QStringLiteral("unknown field '%1'").arg(node.name));
            *out = *var;
            return true;
        }
        return fail(QStringLiteral("type mismatch"));
    }

    bool evalIndex(const ExprNode &node, Value *out)
    {
        Value current;
        if (!eval(*node.lhs, &current))
            return false;
        for (const NodePtr &indexNode : node.indices) {
            Value index;
            if (!eval(*indexNode, &index))
                return false;
            if (current.type() != ValueType::Array || !index.isInteger())
                return fail(QStringLiteral("type mismatch"));
            const std::vector<Value> &elements = current.elements();
            if ((index.isSigned() && index.toInt() < 0) || index.toUInt() >= elements.size())
                return fail(QStringLiteral("index out of bounds"));
            current = elements[size_t(index.toUInt())];
        }
        *out = current;
        return true;
    }

    bool evalDeref(const ExprNode &node, Value *out)
    {
        Value ref;
        if (!eval(*node.lhs, &ref))
            return false;
        if (ref.type() != ValueType::Reference)
            return fail(QStringLiteral("type mismatch"));
        if (!ref.hasReference())
            return fail(QStringLiteral("null reference"));
        if (!m_scope.storage->readByRef(ref.reference(), out))
            return fail(QStringLiteral("dangling reference"));
        return true;
    }

    bool evalUnary(const ExprNode &node, Value *out)
    {
        Value operand;
        if (!eval(*node.lhs, &operand))
            return false;

        if (node.op == QLatin1String("NOT")) {
            if (operand.isBool()) {
                *out = Value::fromBool(!operand.toBool());
                return true;
            }
            if (operand.isUnsigned()) {
                IntegerMask mask(operand.type());
                *out = Value::fromUInt(operand.type(), ~operand.toUInt() & mask.bits);
                return true;
            }
            if (operand.isSigned()) {
                *out = Value::fromInt(operand.type(), ~operand.toInt());
                return true;
            }
            return fail(QStringLiteral("type mismatch"));
        }

        // unary minus
        if (operand.isReal()) {
            *out = Value::fromReal(operand.type(), -operand.toReal());
            return true;
        }
        if (operand.type() == ValueType::Time) {
            qint64 negated = 0;
            if (qSubOverflow(qint64(0), operand.timeNs(), &negated))
                return fail(QStringLiteral("arithmetic overflow"));
            *out = Value::fromTimeNs(negated);
            return true;
        }
        if (operand.isInteger()) {
            const ValueType target = operand.isSigned() ? operand.type()
                                                        : signedOfRank(integerRank(operand.type()) + 1);
            if (operand.isUnsigned() && operand.toUInt() > quint64(std::numeric_limits<qint64>::max()))
                return fail(QStringLiteral("arithmetic overflow"));
            qint64 negated = 0;
            if (qSubOverflow(qint64(0), operand.toInt(), &negated))
                return fail(QStringLiteral("arithmetic overflow"));
            return narrow(Value::fromInt(ValueType::LInt, negated), target, out);
        }
        return fail(QStringLiteral("type mismatch"));
    }

    struct IntegerMask {
        explicit IntegerMask(ValueType type)
        {
            switch (integerRank(type)) {
            case 1: bits = 0xFF; break;
            case 2: bits = 0xFFFF; break;
            case 3: bits = 0xFFFFFFFFu; break;
            default: bits = std::numeric_limits<quint64>::max(); break;
            }
        }
        quint64 bits = 0;
    };

    bool narrow(const Value &wide, ValueType target, Value *out)
    {
        QString error;
        if (!coerceValue(wide, target, out, &error))
            return fail(QStringLiteral("arithmetic overflow"));
        return true;
    }

    bool evalBinary(const ExprNode &node, Value *out)
    {
        Value a, b;
        if (!eval(*node.lhs, &a) || !eval(*node.rhs, &b))
            return false;
        const QString &op = node.op;

        if (op == QLatin1String("AND") || op == QLatin1String("OR") || op == QLatin1String("XOR"))
            return logical(op, a, b, out);
        if (op == QLatin1String("=") || op == QLatin1String("<>") || op == QLatin1String("<")
            || op == QLatin1String("<=") || op == QLatin1String(">") || op == QLatin1String(">="))
            return comparison(op, a, b, out);
        if (op == QLatin1String("**")) {
            if (!a.isNumeric() || !b.isNumeric())
                return fail(QStringLiteral("type mismatch"));
            *out = Value::fromReal(ValueType::LReal, std::pow(a.toReal(), b.toReal()));
            return true;
        }
        return arithmetic(op, a, b, out);
    }

    bool logical(const QString &op, const Value &a, const Value &b, Value *out)
    {
        if (a.isBool() && b.isBool()) {
            bool result = false;
            if (op == QLatin1String("AND"))
                result = a.toBool() && b.toBool();
            else if (op == QLatin1String("OR"))
                result = a.toBool() || b.toBool();
            else
                result = a.toBool() != b.toBool();
            *out = Value::fromBool(result);
            return true;
        }
        if (!a.isInteger() || !b.isInteger())
            return fail(QStringLiteral("type mismatch"));

        const ValueType type = integerResultType(a, b);
        quint64 result = 0;
        if (op == QLatin1String("AND"))
            result = a.toUInt() & b.toUInt();
        else if (op == QLatin1String("OR"))
            result = a.toUInt() | b.toUInt();
        else
            result = a.toUInt() ^ b.toUInt();
        if (Value::defaultFor(type).isUnsigned()) {
            *out = Value::fromUInt(type, result & IntegerMask(type).bits);
            return true;
        }
        return narrow(Value::fromInt(ValueType::LInt, qint64(result)), type, out);
    }

    bool comparison(const QString &op, const Value &a, const Value &b, Value *out)
    {
        int order = 0;
        if (a.isNumeric() && b.isNumeric()) {
            if (a.isReal() || b.isReal()) {
                const double x = a.toReal();
                const double y = b.toReal();
                order = x < y ? -1 : (x > y ? 1 : 0);
            } else {
                order = compareIntegers(a, b);
            }
        } else if (a.isBool() && b.isBool()) {
            order = int(a.toBool()) - int(b.toBool());
        } else if (a.isText() && b.isText()) {
            order = QString::compare(a.text(), b.text());
            order = order < 0 ? -1 : (order > 0 ? 1 : 0);
        } else if (a.type() == ValueType::Time && b.type() == ValueType::Time) {
            order = a.timeNs() < b.timeNs() ? -1 : (a.timeNs() > b.timeNs() ? 1 : 0);
        } else if (a.type() == ValueType::Enum && b.type() == ValueType::Enum
                   && a.typeName().compare(b.typeName(), Qt::CaseInsensitive) == 0) {
            order = a.enumOrdinal() < b.enumOrdinal() ? -1 : (a.enumOrdinal() > b.enumOrdinal() ? 1 : 0);
        } else if (op == QLatin1String("=") || op == QLatin1String("<>")) {
            if (a.type() != b.type())
                return fail(QStringLiteral("type mismatch"));
            order = a == b ? 0 : 1;
        } else {
            return fail(QStringLiteral("type mismatch"));
        }

        bool result = false;
        if (op == QLatin1String("="))
            result = order == 0;
        else if (op == QLatin1String("<>"))
            result = order != 0;
        else if (op == QLatin1String("<"))
            result = order < 0;
        else if (op == QLatin1String("<="))
            result = order <= 0;
        else if (op == QLatin1String(">"))
            result = order > 0;
        else
            result = order >= 0;
        *out = Value::fromBool(result);
        return true;
    }

    bool arithmetic(const QString &op, const Value &a, const Value &b, Value *out)
    {
        if (a.type() == ValueType::Time || b.type() == ValueType::Time)
            return timeArithmetic(op, a, b, out);
        if (!a.isNumeric() || !b.isNumeric())
            return fail(QStringLiteral("type mismatch"));

        if (a.isReal() || b.isReal()) {
            const ValueType type = (a.type() == ValueType::LReal || b.type() == ValueType::LReal
                                    || !(a.type() == ValueType::Real || b.type() == ValueType::Real))
                ? ValueType::LReal : ValueType::Real;
            const double x = a.toReal();
            const double y = b.toReal();
            double result = 0.0;
            if (op == QLatin1String("+"))
                result = x + y;
            else if (op == QLatin1String("-"))
                result = x - y;
            else if (op == QLatin1String("*"))
                result = x * y;
            else if (op == QLatin1String("/")) {
                if (y == 0.0)
                    return fail(QStringLiteral("division by zero"));
                result = x / y;
            } else {
                if (y == 0.0)
                    return fail(QStringLiteral("division by zero"));
                result = std::fmod(x, y);
            }
            *out = Value::fromReal(type, result);
            return true;
        }

        const ValueType type = integerResultType(a, b);
        if (Value::defaultFor(type).isUnsigned()) {
            const quint64 x = a.toUInt();
            const quint64 y = b.toUInt();
            quint64 result = 0;
            bool overflow = false;
            if (op == QLatin1String("+"))
                overflow = qAddOverflow(x, y, &result);
            else if (op == QLatin1String("-"))
                overflow = qSubOverflow(x, y, &result);
            else if (op == QLatin1String("*"))
                overflow = qMulOverflow(x, y, &result);
            else if (y == 0)
                return fail(QStringLiteral("division by zero"));
            else
                result = op == QLatin1String("/") ? x / y : x % y;
            if (overflow)
                return fail(QStringLiteral("arithmetic overflow"));
            return narrow(Value::fromUInt(ValueType::ULInt, result), type, out);
        }

        if ((a.isUnsigned() && a.toUInt() > quint64(std::numeric_limits<qint64>::max()))
            || (b.isUnsigned() && b.toUInt() > quint64(std::numeric_limits<qint64>::max())))
            return fail(QStringLiteral("arithmetic overflow"));
        const qint64 x = a.toInt();
        const qint64 y = b.toInt();
        qint64 result = 0;
        bool overflow = false;
        if (op == QLatin1String("+"))
            overflow = qAddOverflow(x, y, &result);
        else if (op == QLatin1String("-"))
            overflow = qSubOverflow(x, y, &result);
        else if (op == QLatin1String("*"))
            overflow = qMulOverflow(x, y, &result);
        else if (y == 0)
            return fail(QStringLiteral("division by zero"));
        else if (x == std::numeric_limits<qint64>::min() && y == -1)
            overflow = true;
        else
            result = op == QLatin1String("/") ? x / y : x % y;
        if (overflow)
            return fail(QStringLiteral("arithmetic overflow"));
        return narrow(Value::fromInt(ValueType::LInt, result), type, out);
    }

    // False when ns is not finite or does not fit a qint64.
    static bool scaledTimeNs(double ns, qint64 *out)
    {
        // 2^63; every double below it converts exactly
        const double limit = 9223372036854775808.0;
        if (!qIsFinite(ns) || ns >= limit || ns < -limit)
            return false;
        *out = qint64(ns);
        return true;
    }

    bool timeArithmetic(const QString &op, const Value &a, const Value &b, Value *out)
    {
        const bool bothTime = a.type() == ValueType::Time && b.type() == ValueType::Time;
        qint64 result = 0;
        bool overflow = false;
        if (bothTime && op == QLatin1String("+"))
            overflow = qAddOverflow(a.timeNs(), b.timeNs(), &result);
        else if (bothTime && op == QLatin1String("-"))
            overflow = qSubOverflow(a.timeNs(), b.timeNs(), &result);
        else if (a.type() == ValueType::Time && b.isNumeric() && op == QLatin1String("*"))
            overflow = !scaledTimeNs(double(a.timeNs()) * b.toReal(), &result);
        else if (b.type() == ValueType::Time && a.isNumeric() && op == QLatin1String("*"))
            overflow = !scaledTimeNs(double(b.timeNs()) * a.toReal(), &result);
        else if (a.type() == ValueType::Time && b.isNumeric() && op == QLatin1String("/")) {
            if (b.toReal() == 0.0)
                return fail(QStringLiteral("division by zero"));
            overflow = !scaledTimeNs(double(a.timeNs()) / b.toReal(), &result);
        } else {
            return fail(QStringLiteral("type mismatch"));
        }
        if (overflow)
            return fail(QStringLiteral("arithmetic overflow"));
        *out = Value::fromTimeNs(result);
        return true;
    }

    const EvalScope &m_scope;
    QString m_error;
};

} // namespace

bool DebugExpression::parse(const QString &text, const TypeRegistry &types, DebugExpression *out,
                            QString *errorOut)
{
    Parser parser(text, types);
    NodePtr root = parser.parse();
    if (!root) {
        if (errorOut)
            *errorOut = QStringLiteral("parse error: %1").arg(parser.error());
        return false;
    }
    out->m_text = text.trimmed();
    out->m_root = root;
    return true;
}

bool DebugExpression::isName() const
{
    return m_root && m_root->kind == ExprNode::Name;
}

QString DebugExpression::name() const
{
    return isName() ? m_root->name : QString();
}

bool evaluateExpression(const DebugExpression &expr, const EvalScope &scope, Value *out, QString *errorOut)
{
    if (!expr.isValid() || !scope.storage) {
        if (errorOut)
            *errorOut = QStringLiteral("no expression");
        return false;
    }
    Evaluator evaluator(scope);
    if (!evaluator.eval(*expr.root(), out)) {
        if (errorOut)
            *errorOut = evaluator.error();
        return false;
    }
    return true;
}

bool resolveVariable(const EvalScope &scope, const QString &name, ValueRef *out)
{
    if (!scope.storage)
        return false;
    const VariableStorage &storage = *scope.storage;

    const CallFrame *frame = scope.frameId != 0 ? storage.frame(scope.frameId) : storage.currentFrame();
    if (frame) {
        if (frame->locals.contains(name)) {
            out->area = ValueRef::Local;
            out->owner = frame->id;
            out->name = name;
            return true;
        }
        const InstanceData *owner = frame->instanceId != 0 ? storage.instance(frame->instanceId) : nullptr;
        if (owner && owner->vars.contains(name)) {
            out->area = ValueRef::Instance;
            out->owner = frame->instanceId;
            out->name = name;
            return true;
        }
    }

    QStringList candidates;
    candidates << name;
    for (const QString &ns : scope.usingList)
        candidates << ns + QLatin1Char('.') + name;

    for (const QString &candidate : candidates) {
        if (storage.globals().contains(candidate)) {
            out->area = ValueRef::Global;
            out->owner = 0;
            out->name = candidate;
            return true;
        }
        if (storage.retain().contains(candidate)) {
            out->area = ValueRef::Retain;
            out->owner = 0;
            out->name = candidate;
            return true;
        }
    }
    return false;
}
