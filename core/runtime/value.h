#ifndef RUNTIME_VALUE_H
#define RUNTIME_VALUE_H

#include <memory>
#include <vector>

#include <QString>
#include <QtGlobal>

/* Runtime representation of IEC 61131-3 values.
 *
 * Aggregates (arrays, structs) share their payload; copying a Value is
 * cheap and never aliases mutable state. */

enum class ValueType {
    Null,
    Bool,
    SInt,
    Int,
    DInt,
    LInt,
    USInt,
    UInt,
    UDInt,
    ULInt,
    Real,
    LReal,
    Byte,
    Word,
    DWord,
    LWord,
    Time,
    String,
    WString,
    Array,
    Struct,
    Enum,
    Reference,
    Instance
};

// Where a reference points to. Locals are addressed by frame id, instance
// variables by instance id.
struct ValueRef {
    enum Area {
        Global,
        Retain,
        Instance,
        Local
    } area = Global;
    quint32 owner = 0;
    QString name;

    bool operator==(const ValueRef &other) const;
};

struct ValueAggregate;
struct StructField;

class Value
{
public:
    Value() = default;

    static Value fromBool(bool value);
    static Value fromInt(ValueType type, qint64 value);
    static Value fromUInt(ValueType type, quint64 value);
    static Value fromReal(ValueType type, double value);
    static Value fromTimeNs(qint64 nanoseconds);
    static Value fromString(const QString &text, bool wide = false);
    static Value fromArray(std::vector<Value> elements);
    static Value fromStruct(const QString &typeName, std::vector<StructField> fields);
    static Value fromEnum(const QString &typeName, const QString &variant, qint64 ordinal);
    static Value fromReference(const ValueRef &ref);
    static Value nullReference();
    static Value fromInstance(quint32 instanceId);

    // Zero value of an elementary type ("0", FALSE, '', T#0s).
    static Value defaultFor(ValueType type);

    ValueType type() const { return m_type; }
    bool isNull() const { return m_type == ValueType::Null; }
    bool isBool() const { return m_type == ValueType::Bool; }
    bool isSigned() const;
    bool isUnsigned() const;
    bool isInteger() const { return isSigned() || isUnsigned(); }
    bool isReal() const { return m_type == ValueType::Real || m_type == ValueType::LReal; }
    bool isNumeric() const { return isInteger() || isReal(); }
    bool isText() const { return m_type == ValueType::String || m_type == ValueType::WString; }

    bool toBool() const { return m_int != 0; }
    qint64 toInt() const;
    quint64 toUInt() const;
    double toReal() const;
    qint64 timeNs() const { return m_int; }
    QString text() const { return m_text; }

    const std::vector<Value> &elements() const;
    const std::vector<StructField> &fields() const;
    const Value *field(const QString &name) const;
    QString typeName() const;
    QString enumVariant() const { return m_text; }
    qint64 enumOrdinal() const { return m_int; }

    bool hasReference() const { return m_type == ValueType::Reference && m_int != 0; }
    ValueRef reference() const { return m_ref; }
    quint32 instanceId() const { return quint32(m_int); }

    bool operator==(const Value &other) const;
    bool operator!=(const Value &other) const { return !(*this == other); }

private:
    ValueType m_type = ValueType::Null;
    qint64 m_int = 0;
    quint64 m_uint = 0;
    double m_real = 0.0;
    QString m_text;
    ValueRef m_ref;
    std::shared_ptr<const ValueAggregate> m_aggregate;
};

struct StructField {
    QString name;
    Value value;
};

struct ValueAggregate {
    QString typeName;
    std::vector<Value> elements;
    std::vector<StructField> fields;
};

// Debugger presentation: "TRUE", "42", "Motor {...}", "Mode::Run", ...
QString formatValue(const Value &value);
// IEC type name of the value ("DINT", "ARRAY", "REF", ...)
QString valueTypeName(const Value &value);

bool parseValueTypeName(const QString &name, ValueType *out);
QString elementaryTypeName(ValueType type);

/* Converts value to an elementary target type. Integers are range checked;
 * reals are truncated toward zero when assigned to integers. */
bool coerceValue(const Value &value, ValueType target, Value *out, QString *errorOut = nullptr);

#endif
