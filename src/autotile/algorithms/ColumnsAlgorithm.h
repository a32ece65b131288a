// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../TilingAlgorithm.h"

namespace Tessera {

/**
 * @brief Columns tiling algorithm
 *
 * One full-height column per window, all of equal width. The registry
 * also resolves the custom tag to this algorithm.
 *
 * Layout examples:
 * ```
 * 1 window:    2 windows:   3 windows:   4 windows:
 * +----------+ +-----+----+ +---+---+---+ +--+--+--+--+
 * |          | |     |    | |   |   |   | |  |  |  |  |
 * |    1     | |  1  |  2 | | 1 | 2 | 3 | |1 |2 |3 |4 |
 * |          | |     |    | |   |   |   | |  |  |  |  |
 * +----------+ +-----+----+ +---+---+---+ +--+--+--+--+
 * ```
 */
class TESSERA_EXPORT ColumnsAlgorithm : public TilingAlgorithm
{
    Q_OBJECT

public:
    explicit ColumnsAlgorithm(QObject *parent = nullptr);
    ~ColumnsAlgorithm() override = default;

    QString name() const override;
    QString description() const override;

protected:
    QVector<QRect> tile(const QRect &inner, const TilingParams &params) const override;
};

} // namespace Tessera
