// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ColumnsAlgorithm.h"
#include <KLocalizedString>

namespace Tessera {

ColumnsAlgorithm::ColumnsAlgorithm(QObject *parent)
    : TilingAlgorithm(parent)
{
}

QString ColumnsAlgorithm::name() const
{
    return i18n("Columns");
}

QString ColumnsAlgorithm::description() const
{
    return i18n("Equal-width vertical columns");
}

QVector<QRect> ColumnsAlgorithm::tile(const QRect &inner, const TilingParams &params) const
{
    QVector<QRect> slots;
    slots.reserve(params.windowCount);
    for (const Span &column : divide(inner.x(), inner.width(), params.windowCount, params.gap)) {
        slots.append(QRect(column.offset, inner.y(), column.length, inner.height()));
    }
    return slots;
}

} // namespace Tessera
