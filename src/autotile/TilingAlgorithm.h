// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tessera_export.h"
#include "core/constants.h"
#include <QObject>
#include <QRect>
#include <QString>
#include <QVector>

namespace Tessera {

/**
 * @brief Inputs of one layout computation
 *
 * Mirrors the geometric fields of a TilingPattern, plus the window count and
 * the monitor's usable area.
 */
struct TilingParams {
    int windowCount = 0;
    QRect area;                                    ///< Usable area in absolute pixels
    int gap = 0;                                   ///< Space between neighbouring slots
    int margin = 0;                                ///< Inset on every edge of the area
    qreal mainAreaRatio = Defaults::MainAreaRatio;
    Qt::Orientation orientation = Qt::Horizontal;  ///< Vertical for portrait monitors
};

/**
 * @brief Stateless layout function behind a pattern's algorithm tag
 *
 * calculateSlots() handles the cases shared by every algorithm (no windows,
 * an area the margin consumes) and hands the inset area to tile(). One
 * instance serves every monitor and workspace.
 */
class TESSERA_EXPORT TilingAlgorithm : public QObject
{
    Q_OBJECT
    Q_DISABLE_COPY_MOVE(TilingAlgorithm)

    Q_PROPERTY(QString name READ name CONSTANT)
    Q_PROPERTY(QString description READ description CONSTANT)

public:
    explicit TilingAlgorithm(QObject *parent = nullptr);
    ~TilingAlgorithm() override = default;

    virtual QString name() const = 0;
    virtual QString description() const = 0;

    /**
     * @brief Slots for params.windowCount windows, in absolute pixels
     *
     * @return exactly params.windowCount rectangles, or none when the count
     *         is not positive or the margin leaves no area
     */
    QVector<QRect> calculateSlots(const TilingParams &params) const;

    /**
     * @brief @p area inset by @p margin on each edge; null when nothing is left
     */
    static QRect innerRect(const QRect &area, int margin);

protected:
    /// A run of pixels along one axis
    struct Span {
        int offset = 0;
        int length = 0;
    };

    /**
     * @brief Lay out @p params.windowCount slots inside @p inner
     *
     * Called only with a positive window count and a non-empty @p inner.
     */
    virtual QVector<QRect> tile(const QRect &inner, const TilingParams &params) const = 0;

    /**
     * @brief Split [start, start + length) into @p count spans separated by @p gap
     *
     * Leftover pixels go to the first spans, so the spans and gaps add up to
     * @p length exactly. A span is never shorter than one pixel; when @p gap
     * leaves less than that, the gap shrinks. Only @p count above @p length
     * runs past the end.
     */
    static QVector<Span> divide(int start, int length, int count, int gap);
};

} // namespace Tessera
