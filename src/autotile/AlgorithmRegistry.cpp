// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "AlgorithmRegistry.h"
#include "TilingAlgorithm.h"
#include "algorithms/ColumnsAlgorithm.h"
#include "algorithms/GridAlgorithm.h"
#include "algorithms/MasterStackAlgorithm.h"
#include "core/constants.h"
#include "core/logging.h"

namespace Tessera {

AlgorithmRegistry::AlgorithmRegistry(QObject *parent)
    : QObject(parent)
{
    registerAlgorithm(AlgorithmId::PrimaryStack, new MasterStackAlgorithm());
    registerAlgorithm(AlgorithmId::Grid, new GridAlgorithm());
    registerAlgorithm(AlgorithmId::Columns, new ColumnsAlgorithm());
    addAlias(AlgorithmId::Custom, AlgorithmId::Columns);
}

// Algorithms are QObject children and go with ~QObject()
AlgorithmRegistry::~AlgorithmRegistry() = default;

void AlgorithmRegistry::registerAlgorithm(const QString &id, TilingAlgorithm *algorithm)
{
    if (!algorithm) {
        return;
    }
    if (id.isEmpty()) {
        qCWarning(lcTiling) << "Refusing to register algorithm" << algorithm->name() << "without a tag";
        delete algorithm;
        return;
    }

    if (m_aliases.remove(id) > 0) {
        m_aliasOrder.removeOne(id);
    }

    TilingAlgorithm *previous = m_algorithms.value(id);
    if (previous == algorithm) {
        return;
    }
    if (previous) {
        qCDebug(lcTiling) << "Replacing algorithm" << previous->name() << "under" << id;
        delete previous;
    } else {
        m_order.append(id);
    }

    algorithm->setParent(this);
    m_algorithms.insert(id, algorithm);
    Q_EMIT algorithmRegistered(id);
}

bool AlgorithmRegistry::addAlias(const QString &alias, const QString &target)
{
    if (alias.isEmpty() || m_algorithms.contains(alias) || !m_algorithms.contains(target)) {
        return false;
    }
    if (!m_aliases.contains(alias)) {
        m_aliasOrder.append(alias);
    }
    m_aliases.insert(alias, target);
    Q_EMIT algorithmRegistered(alias);
    return true;
}

bool AlgorithmRegistry::unregisterAlgorithm(const QString &id)
{
    if (m_aliases.remove(id) > 0) {
        m_aliasOrder.removeOne(id);
        Q_EMIT algorithmUnregistered(id);
        return true;
    }

    TilingAlgorithm *algorithm = m_algorithms.take(id);
    if (!algorithm) {
        return false;
    }
    m_order.removeOne(id);
    delete algorithm;
    Q_EMIT algorithmUnregistered(id);
    return true;
}

QString AlgorithmRegistry::resolveId(const QString &id) const
{
    return m_aliases.value(id, id);
}

TilingAlgorithm *AlgorithmRegistry::algorithm(const QString &id) const
{
    return m_algorithms.value(resolveId(id), nullptr);
}

QStringList AlgorithmRegistry::availableAlgorithms() const
{
    return m_order + m_aliasOrder;
}

bool AlgorithmRegistry::hasAlgorithm(const QString &id) const
{
    return algorithm(id) != nullptr;
}

bool AlgorithmRegistry::isAlias(const QString &id) const
{
    return m_aliases.contains(id);
}

QString AlgorithmRegistry::defaultAlgorithmId()
{
    return AlgorithmId::PrimaryStack;
}

TilingAlgorithm *AlgorithmRegistry::defaultAlgorithm() const
{
    return algorithm(defaultAlgorithmId());
}

} // namespace Tessera
