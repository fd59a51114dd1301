#include "core/runtime/value.h"

#include <cmath>
#include <limits>

namespace {

struct IntegerRange {
    qint64 min;
    quint64 max;
};

bool integerRange(ValueType type, IntegerRange *out)
{
    switch (type) {
    case ValueType::SInt: *out = { -128, 127 }; return true;
    case ValueType::Int: *out = { -32768, 32767 }; return true;
    case ValueType::DInt: *out = { std::numeric_limits<qint32>::min(), quint64(std::numeric_limits<qint32>::max()) }; return true;
    case ValueType::LInt: *out = { std::numeric_limits<qint64>::min(), quint64(std::numeric_limits<qint64>::max()) }; return true;
    case ValueType::USInt:
    case ValueType::Byte: *out = { 0, 0xFF }; return true;
    case ValueType::UInt:
    case ValueType::Word: *out = { 0, 0xFFFF }; return true;
    case ValueType::UDInt:
    case ValueType::DWord: *out = { 0, 0xFFFFFFFFu }; return true;
    case ValueType::ULInt:
    case ValueType::LWord: *out = { 0, std::numeric_limits<quint64>::max() }; return true;
    default: break;
    }
    return false;
}

QString formatReal(double value)
{
    if (std::isnan(value))
        return QStringLiteral("NaN");
    if (std::isinf(value))
        return value > 0 ? QStringLiteral("inf") : QStringLiteral("-inf");
    QString text = QString::number(value, 'g', 15);
    if (!text.contains(QLatin1Char('.')) && !text.contains(QLatin1Char('e')))
        text += QStringLiteral(".0");
    return text;
}

const std::vector<Value> &emptyElements()
{
    static const std::vector<Value> empty;
    return empty;
}

const std::vector<StructField> &emptyFields()
{
    static const std::vector<StructField> empty;
    return empty;
}

} // namespace

bool ValueRef::operator==(const ValueRef &other) const
{
    return area == other.area && owner == other.owner
        && name.compare(other.name, Qt::CaseInsensitive) == 0;
}

Value Value::fromBool(bool value)
{
    Value v;
    v.m_type = ValueType::Bool;
    v.m_int = value ? 1 : 0;
    return v;
}

Value Value::fromInt(ValueType type, qint64 value)
{
    Value v;
    v.m_type = type;
    if (v.isUnsigned())
        v.m_uint = quint64(value);
    else
        v.m_int = value;
    return v;
}

Value Value::fromUInt(ValueType type, quint64 value)
{
    Value v;
    v.m_type = type;
    if (v.isSigned())
        v.m_int = qint64(value);
    else
        v.m_uint = value;
    return v;
}

Value Value::fromReal(ValueType type, double value)
{
    Value v;
    v.m_type = type == ValueType::Real ? ValueType::Real : ValueType::LReal;
    v.m_real = v.m_type == ValueType::Real ? double(float(value)) : value;
    return v;
}

Value Value::fromTimeNs(qint64 nanoseconds)
{
    Value v;
    v.m_type = ValueType::Time;
    v.m_int = nanoseconds;
    return v;
}

Value Value::fromString(const QString &text, bool wide)
{
    Value v;
    v.m_type = wide ? ValueType::WString : ValueType::String;
    v.m_text = text;
    return v;
}

Value Value::fromArray(std::vector<Value> elements)
{
    Value v;
    v.m_type = ValueType::Array;
    auto aggregate = std::make_shared<ValueAggregate>();
    aggregate->elements = std::move(elements);
    v.m_aggregate = aggregate;
    return v;
}

Value Value::fromStruct(const QString &typeName, std::vector<StructField> fields)
{
    Value v;
    v.m_type = ValueType::Struct;
    auto aggregate = std::make_shared<ValueAggregate>();
    aggregate->typeName = typeName;
    aggregate->fields = std::move(fields);
    v.m_aggregate = aggregate;
    return v;
}

Value Value::fromEnum(const QString &typeName, const QString &variant, qint64 ordinal)
{
    Value v;
    v.m_type = ValueType::Enum;
    v.m_text = variant;
    v.m_int = ordinal;
    auto aggregate = std::make_shared<ValueAggregate>();
    aggregate->typeName = typeName;
    v.m_aggregate = aggregate;
    return v;
}

Value Value::fromReference(const ValueRef &ref)
{
    Value v;
    v.m_type = ValueType::Reference;
    v.m_int = 1;
    v.m_ref = ref;
    return v;
}

Value Value::nullReference()
{
    Value v;
    v.m_type = ValueType::Reference;
    return v;
}

Value Value::fromInstance(quint32 instanceId)
{
    Value v;
    v.m_type = ValueType::Instance;
    v.m_int = instanceId;
    return v;
}

Value Value::defaultFor(ValueType type)
{
    switch (type) {
    case ValueType::Bool: return fromBool(false);
    case ValueType::Real:
    case ValueType::LReal: return fromReal(type, 0.0);
    case ValueType::Time: return fromTimeNs(0);
    case ValueType::String: return fromString(QString());
    case ValueType::WString: return fromString(QString(), true);
    case ValueType::Reference: return nullReference();
    default: break;
    }
    IntegerRange range;
    if (integerRange(type, &range))
        return fromInt(type, 0);
    return Value();
}

bool Value::isSigned() const
{
    switch (m_type) {
    case ValueType::SInt:
    case ValueType::Int:
    case ValueType::DInt:
    case ValueType::LInt:
        return true;
    default:
        return false;
    }
}

bool Value::isUnsigned() const
{
    switch (m_type) {
    case ValueType::USInt:
    case ValueType::UInt:
    case ValueType::UDInt:
    case ValueType::ULInt:
    case ValueType::Byte:
    case ValueType::Word:
    case ValueType::DWord:
    case ValueType::LWord:
        return true;
    default:
        return false;
    }
}

qint64 Value::toInt() const
{
    if (isUnsigned())
        return qint64(m_uint);
    if (isReal())
        return qint64(m_real);
    return m_int;
}

quint64 Value::toUInt() const
{
    if (isUnsigned())
        return m_uint;
    if (isReal())
        return quint64(m_real);
    return quint64(m_int);
}

double Value::toReal() const
{
    if (isReal())
        return m_real;
    if (isUnsigned())
        return double(m_uint);
    return double(m_int);
}

const std::vector<Value> &Value::elements() const
{
    return m_aggregate ? m_aggregate->elements : emptyElements();
}

const std::vector<StructField> &Value::fields() const
{
    return m_aggregate ? m_aggregate->fields : emptyFields();
}

const Value *Value::field(const QString &name) const
{
    for (const StructField &f : fields()) {
        if (f.name.compare(name, Qt::CaseInsensitive) == 0)
            return &f.value;
    }
    return nullptr;
}

QString Value::typeName() const
{
    return m_aggregate ? m_aggregate->typeName : QString();
}

bool Value::operator==(const Value &other) const
{
    if (m_type != other.m_type)
        return false;

    switch (m_type) {
    case ValueType::Null:
        return true;
    case ValueType::Real:
    case ValueType::LReal:
        return m_real == other.m_real;
    case ValueType::String:
    case ValueType::WString:
        return m_text == other.m_text;
    case ValueType::Enum:
        return typeName() == other.typeName() && m_int == other.m_int;
    case ValueType::Reference:
        return m_int == other.m_int && (m_int == 0 || m_ref == other.m_ref);
    case ValueType::Array: {
        const auto &a = elements();
        const auto &b = other.elements();
        if (a.size() != b.size())
            return false;
        for (size_t i = 0; i < a.size(); ++i) {
            if (a[i] != b[i])
                return false;
        }
        return true;
    }
    case ValueType::Struct: {
        if (typeName() != other.typeName())
            return false;
        const auto &a = fields();
        const auto &b = other.fields();
        if (a.size() != b.size())
            return false;
        for (size_t i = 0; i < a.size(); ++i) {
            if (a[i].name != b[i].name || a[i].value != b[i].value)
                return false;
        }
        return true;
    }
    default:
        break;
    }

    if (isUnsigned())
        return m_uint == other.m_uint;
    return m_int == other.m_int;
}

QString formatValue(const Value &value)
{
    switch (value.type()) {
    case ValueType::Null:
        return QStringLiteral("NULL");
    case ValueType::Bool:
        return value.toBool() ? QStringLiteral("TRUE") : QStringLiteral("FALSE");
    case ValueType::Real:
    case ValueType::LReal:
        return formatReal(value.toReal());
    case ValueType::Time: {
        const qint64 ns = value.timeNs();
        if (ns % 1000000 == 0)
            return QStringLiteral("T#%1ms").arg(ns / 1000000);
        return QStringLiteral("T#%1ns").arg(ns);
    }
    case ValueType::String:
    case ValueType::WString:
        return value.text();
    case ValueType::Array:
        return QStringLiteral("[%1]").arg(value.elements().size());
    case ValueType::Struct:
        return QStringLiteral("%1 {...}").arg(value.typeName());
    case ValueType::Enum:
        return QStringLiteral("%1::%2").arg(value.typeName(), value.enumVariant());
    case ValueType::Reference:
        return value.hasReference() ? QStringLiteral("REF") : QStringLiteral("NULL_REF");
    case ValueType::Instance:
        return QStringLiteral("Instance(%1)").arg(value.instanceId());
    default:
        break;
    }

    if (value.isUnsigned())
        return QString::number(value.toUInt());
    return QString::number(value.toInt());
}

QString elementaryTypeName(ValueType type)
{
    switch (type) {
    case ValueType::Null: return QStringLiteral("NULL");
    case ValueType::Bool: return QStringLiteral("BOOL");
    case ValueType::SInt: return QStringLiteral("SINT");
    case ValueType::Int: return QStringLiteral("INT");
    case ValueType::DInt: return QStringLiteral("DINT");
    case ValueType::LInt: return QStringLiteral("LINT");
    case ValueType::USInt: return QStringLiteral("USINT");
    case ValueType::UInt: return QStringLiteral("UINT");
    case ValueType::UDInt: return QStringLiteral("UDINT");
    case ValueType::ULInt: return QStringLiteral("ULINT");
    case ValueType::Real: return QStringLiteral("REAL");
    case ValueType::LReal: return QStringLiteral("LREAL");
    case ValueType::Byte: return QStringLiteral("BYTE");
    case ValueType::Word: return QStringLiteral("WORD");
    case ValueType::DWord: return QStringLiteral("DWORD");
    case ValueType::LWord: return QStringLiteral("LWORD");
    case ValueType::Time: return QStringLiteral("TIME");
    case ValueType::String: return QStringLiteral("STRING");
    case ValueType::WString: return QStringLiteral("WSTRING");
    case ValueType::Array: return QStringLiteral("ARRAY");
    case ValueType::Reference: return QStringLiteral("REF");
    case ValueType::Instance: return QStringLiteral("INSTANCE");
    case ValueType::Struct:
    case ValueType::Enum:
        break;
    }
    return QString();
}

QString valueTypeName(const Value &value)
{
    if (value.type() == ValueType::Struct || value.type() == ValueType::Enum)
        return value.typeName();
    return elementaryTypeName(value.type());
}

bool parseValueTypeName(const QString &name, ValueType *out)
{
    static const ValueType elementary[] = {
        ValueType::Bool, ValueType::SInt, ValueType::Int, ValueType::DInt, ValueType::LInt,
        ValueType::USInt, ValueType::UInt, ValueType::UDInt, ValueType::ULInt,
        ValueType::Real, ValueType::LReal, ValueType::Byte, ValueType::Word,
        ValueType::DWord, ValueType::LWord, ValueType::Time, ValueType::String,
        ValueType::WString
    };
    const QString upper = name.trimmed().toUpper();
    for (ValueType type : elementary) {
        if (elementaryTypeName(type) == upper) {
            *out = type;
            return true;
        }
    }
    return false;
}

bool coerceValue(const Value &value, ValueType target, Value *out, QString *errorOut)
{
    if (value.type() == target) {
        *out = value;
        return true;
    }

    const Value shape = Value::defaultFor(target);
    if (shape.isInteger()) {
        if (!value.isNumeric() && !value.isBool()) {
            if (errorOut)
                *errorOut = QStringLiteral("type mismatch");
            return false;
        }
        IntegerRange range;
        integerRange(target, &range);
        if (value.isReal()) {
            const double truncated = std::trunc(value.toReal());
            if (truncated < double(range.min) || truncated > double(range.max)) {
                if (errorOut)
                    *errorOut = QStringLiteral("value out of range for %1").arg(elementaryTypeName(target));
                return false;
            }
            *out = shape.isUnsigned() ? Value::fromUInt(target, quint64(truncated))
                                      : Value::fromInt(target, qint64(truncated));
            return true;
        }
        const bool negative = value.isSigned() && value.toInt() < 0;
        if (negative ? value.toInt() < range.min : value.toUInt() > range.max) {
            if (errorOut)
                *errorOut = QStringLiteral("value out of range for %1").arg(elementaryTypeName(target));
            return false;
        }
        *out = shape.isUnsigned() ? Value::fromUInt(target, value.toUInt())
                                  : Value::fromInt(target, value.toInt());
        return true;
    }

    if (shape.isReal() && value.isNumeric()) {
        *out = Value::fromReal(target, value.toReal());
        return true;
    }

    if (shape.isText() && value.isText()) {
        *out = Value::fromString(value.text(), target == ValueType::WString);
        return true;
    }

    if (target == ValueType::Bool && value.isInteger()) {
        *out = Value::fromBool(value.toUInt() != 0);
        return true;
    }

    if (errorOut)
        *errorOut = QStringLiteral("type mismatch");
    return false;
}
