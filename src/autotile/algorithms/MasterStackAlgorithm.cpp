// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "MasterStackAlgorithm.h"
#include <KLocalizedString>
#include <algorithm>

namespace Tessera {

using namespace Defaults;

MasterStackAlgorithm::MasterStackAlgorithm(QObject *parent)
    : TilingAlgorithm(parent)
{
}

QString MasterStackAlgorithm::name() const
{
    return i18n("Primary + Stack");
}

QString MasterStackAlgorithm::description() const
{
    return i18n("Large primary area with stacked secondary windows");
}

QVector<QRect> MasterStackAlgorithm::tile(const QRect &inner, const TilingParams &params) const
{
    if (params.windowCount == 1) {
        return {inner};
    }

    const qreal ratio = std::clamp(params.mainAreaRatio, MinMainAreaRatio, MaxMainAreaRatio);
    const bool portrait = params.orientation == Qt::Vertical;
    const int extent = portrait ? inner.height() : inner.width();

    // The gap between primary and stack comes out of the split extent and
    // leaves at least a pixel on each side
    const int gap = std::clamp(params.gap, 0, std::max(extent - 2, 0));
    const int content = std::max(extent - gap, 2);
    const int primary = std::max(static_cast<int>(content * ratio), 1);
    const int stack = std::max(content - primary, 1);

    QVector<QRect> slots;
    slots.reserve(params.windowCount);

    if (portrait) {
        slots.append(QRect(inner.x(), inner.y(), inner.width(), primary));
        const int stackTop = inner.y() + primary + gap;
        for (const Span &column : divide(inner.x(), inner.width(), params.windowCount - 1, gap)) {
            slots.append(QRect(column.offset, stackTop, column.length, stack));
        }
        return slots;
    }

    slots.append(QRect(inner.x(), inner.y(), primary, inner.height()));
    const int stackLeft = inner.x() + primary + gap;
    for (const Span &row : divide(inner.y(), inner.height(), params.windowCount - 1, gap)) {
        slots.append(QRect(stackLeft, row.offset, stack, row.length));
    }
    return slots;
}

} // namespace Tessera
