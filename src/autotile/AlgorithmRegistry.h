// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tessera_export.h"
#include <QHash>
#include <QObject>
#include <QString>
#include <QStringList>

namespace Tessera {

class TilingAlgorithm;

/**
 * @brief Maps the algorithm tag of a TilingPattern to a TilingAlgorithm
 *
 * Each TilingEngine owns one registry. Tags either name an algorithm owned
 * by the registry or are aliases that resolve to another tag. The built-in
 * set is:
 * - primary-stack (default): one primary window plus an even stack
 * - grid: near-square grid filled row-major
 * - columns: equal-width vertical columns
 * - custom: alias of columns
 *
 * @see AlgorithmId in constants.h for the tag constants
 */
class TESSERA_EXPORT AlgorithmRegistry : public QObject
{
    Q_OBJECT
    Q_DISABLE_COPY_MOVE(AlgorithmRegistry)

public:
    explicit AlgorithmRegistry(QObject *parent = nullptr);
    ~AlgorithmRegistry() override;

    /**
     * @brief Register an algorithm under a tag, taking ownership
     *
     * A previous algorithm under the same tag is deleted. A tag that was an
     * alias stops being one. An empty tag deletes @p algorithm and registers
     * nothing.
     */
    void registerAlgorithm(const QString &id, TilingAlgorithm *algorithm);

    /**
     * @brief Let @p alias resolve to the algorithm registered as @p target
     *
     * @return false if @p target is not a registered algorithm or @p alias
     *         already names one
     */
    bool addAlias(const QString &alias, const QString &target);

    /**
     * @brief Remove an algorithm or an alias
     *
     * Aliases pointing at a removed algorithm resolve to nothing until the
     * tag is registered again.
     */
    bool unregisterAlgorithm(const QString &id);

    /// Algorithm for a tag, following aliases; nullptr when unknown
    TilingAlgorithm *algorithm(const QString &id) const;

    /// Tag of the algorithm that actually serves @p id
    QString resolveId(const QString &id) const;

    /// Registered tags followed by aliases, each in insertion order
    QStringList availableAlgorithms() const;

    bool hasAlgorithm(const QString &id) const;
    bool isAlias(const QString &id) const;

    static QString defaultAlgorithmId();
    TilingAlgorithm *defaultAlgorithm() const;

Q_SIGNALS:
    void algorithmRegistered(const QString &id);
    void algorithmUnregistered(const QString &id);

private:
    QHash<QString, TilingAlgorithm *> m_algorithms;
    QHash<QString, QString> m_aliases;
    QStringList m_order;
    QStringList m_aliasOrder;
};

} // namespace Tessera
