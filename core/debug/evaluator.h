#ifndef DEBUG_EVALUATOR_H
#define DEBUG_EVALUATOR_H

#include <memory>

#include <QString>
#include <QStringList>

#include "core/runtime/metadata.h"
#include "core/runtime/storage.h"
#include "core/runtime/value.h"

struct ExprNode;

/* Parsed Structured Text expression.
 *
 * Supported: literals (BOOL, integers incl. 2#/8#/16#, reals, strings,
 * T# durations, typed literals like INT#5), enum literals Type#Variant,
 * names, member access, indexing, dereference (^), NOT, unary minus, **,
 * * / MOD, + -, comparisons, AND/&, XOR, OR and parentheses. */
class DebugExpression
{
public:
    static bool parse(const QString &text, const TypeRegistry &types, DebugExpression *out,
                      QString *errorOut = nullptr);

    bool isValid() const { return m_root != nullptr; }
    QString text() const { return m_text; }
    // True when the whole expression is a single identifier.
    bool isName() const;
    QString name() const;
    const ExprNode *root() const { return m_root.get(); }

private:
    QString m_text;
    std::shared_ptr<const ExprNode> m_root;
};

struct EvalScope {
    const VariableStorage *storage = nullptr;
    quint32 frameId = 0; // 0 selects the current frame
    QStringList usingList;
};

bool evaluateExpression(const DebugExpression &expr, const EvalScope &scope, Value *out,
                        QString *errorOut = nullptr);

/* Finds where name lives: frame locals, the frame's instance, globals,
 * retain, then "<using>.<name>" in globals and retain. */
bool resolveVariable(const EvalScope &scope, const QString &name, ValueRef *out);

#endif
