// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../TilingAlgorithm.h"

namespace Tessera {

/**
 * @brief Primary-stack tiling algorithm
 *
 * The first window takes mainAreaRatio of the width; the others share the
 * rest as an even stack. A portrait monitor splits top/bottom, with the
 * stack divided into columns.
 *
 * Layout example (landscape, 1 primary, 3 stack):
 * ```
 * +------------------+--------+
 * |                  |   2    |
 * |     PRIMARY      |--------|
 * |     (60%)        |   3    |
 * |                  |--------|
 * |                  |   4    |
 * +------------------+--------+
 * ```
 */
class TESSERA_EXPORT MasterStackAlgorithm : public TilingAlgorithm
{
    Q_OBJECT

public:
    explicit MasterStackAlgorithm(QObject *parent = nullptr);
    ~MasterStackAlgorithm() override = default;

    QString name() const override;
    QString description() const override;

protected:
    QVector<QRect> tile(const QRect &inner, const TilingParams &params) const override;
};

} // namespace Tessera
