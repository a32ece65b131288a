// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "GridAlgorithm.h"
#include <KLocalizedString>
#include <QtMath>

namespace Tessera {

GridAlgorithm::GridAlgorithm(QObject *parent)
    : TilingAlgorithm(parent)
{
}

QString GridAlgorithm::name() const
{
    return i18n("Grid");
}

QString GridAlgorithm::description() const
{
    return i18n("Near-square grid filled row by row");
}

int GridAlgorithm::columnsFor(int windowCount)
{
    if (windowCount <= 0) {
        return 0;
    }
    return qCeil(qSqrt(static_cast<qreal>(windowCount)));
}

int GridAlgorithm::rowsFor(int windowCount)
{
    const int columns = columnsFor(windowCount);
    if (columns == 0) {
        return 0;
    }
    return (windowCount + columns - 1) / columns;
}

QVector<QRect> GridAlgorithm::tile(const QRect &inner, const TilingParams &params) const
{
    const int columns = columnsFor(params.windowCount);
    const QVector<Span> columnSpans = divide(inner.x(), inner.width(), columns, params.gap);
    const QVector<Span> rowSpans = divide(inner.y(), inner.height(), rowsFor(params.windowCount), params.gap);

    QVector<QRect> slots;
    slots.reserve(params.windowCount);
    for (int i = 0; i < params.windowCount; ++i) {
        const Span &column = columnSpans[i % columns];
        const Span &row = rowSpans[i / columns];
        slots.append(QRect(column.offset, row.offset, column.length, row.length));
    }
    return slots;
}

} // namespace Tessera
