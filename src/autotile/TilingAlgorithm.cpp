// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "TilingAlgorithm.h"
#include <algorithm>

namespace Tessera {

TilingAlgorithm::TilingAlgorithm(QObject *parent)
    : QObject(parent)
{
}

QVector<QRect> TilingAlgorithm::calculateSlots(const TilingParams &params) const
{
    if (params.windowCount <= 0 || !params.area.isValid()) {
        return {};
    }
    const QRect inner = innerRect(params.area, params.margin);
    if (inner.isNull()) {
        return {};
    }
    return tile(inner, params);
}

QRect TilingAlgorithm::innerRect(const QRect &area, int margin)
{
    const int inset = std::max(margin, 0);
    const QRect inner = area.adjusted(inset, inset, -inset, -inset);
    return inner.isValid() ? inner : QRect();
}

QVector<TilingAlgorithm::Span> TilingAlgorithm::divide(int start, int length, int count, int gap)
{
    QVector<Span> spans;
    if (count <= 0) {
        return spans;
    }

    int spacing = std::max(gap, 0);
    // Gaps shrink before any span drops below one pixel
    if (count > 1 && (count - 1) * spacing > length - count) {
        spacing = std::max(length - count, 0) / (count - 1);
    }
    const int available = std::max(length - (count - 1) * spacing, count);
    const int base = available / count;
    int leftover = available % count;

    spans.reserve(count);
    int offset = start;
    for (int i = 0; i < count; ++i) {
        const int size = leftover-- > 0 ? base + 1 : base;
        spans.append({offset, size});
        offset += size + spacing;
    }
    return spans;
}

} // namespace Tessera
