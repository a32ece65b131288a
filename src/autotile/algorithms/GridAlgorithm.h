// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../TilingAlgorithm.h"

namespace Tessera {

/**
 * @brief Grid tiling algorithm
 *
 * ceil(sqrt(n)) columns and ceil(n / columns) rows, filled row-major. Cells
 * of the last row stay the width of the other rows' cells, so a partial last
 * row leaves the right-hand cells empty.
 *
 * Layout example (5 windows):
 * ```
 * +-----+-----+-----+
 * |  1  |  2  |  3  |
 * +-----+-----+-----+
 * |  4  |  5  |     |
 * +-----+-----+-----+
 * ```
 */
class TESSERA_EXPORT GridAlgorithm : public TilingAlgorithm
{
    Q_OBJECT

public:
    explicit GridAlgorithm(QObject *parent = nullptr);
    ~GridAlgorithm() override = default;

    QString name() const override;
    QString description() const override;

    static int columnsFor(int windowCount);
    static int rowsFor(int windowCount);

protected:
    QVector<QRect> tile(const QRect &inner, const TilingParams &params) const override;
};

} // namespace Tessera
