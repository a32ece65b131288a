// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tessera_export.h"
#include <QRegularExpression>
#include <QString>
#include <optional>

namespace Tessera {

struct WindowSnapshot;

/**
 * @brief Compiled application/title matcher
 *
 * Built once when a WindowRule or ApplicationProfile is committed, then
 * evaluated for every window during plan computation without re-parsing
 * any pattern.
 *
 * An empty field matches anything; a matcher with every field empty matches
 * nothing.
 */
class TESSERA_EXPORT ApplicationMatcher
{
public:
    ApplicationMatcher() = default;

    /**
     * @brief Compile a matcher
     * @param applicationId Exact bundle/process id (may be empty)
     * @param applicationGlob Bundle/process id glob with `*` and `?` (may be empty)
     * @param titlePattern Regular expression for the window title (may be empty)
     * @param errorString Receives the reason when compilation fails (may be null)
     * @return The matcher, or std::nullopt if a pattern is invalid
     */
    static std::optional<ApplicationMatcher> compile(const QString& applicationId, const QString& applicationGlob,
                                                     const QString& titlePattern, QString* errorString = nullptr);

    bool matches(const WindowSnapshot& window) const;
    bool matches(const QString& applicationId, const QString& title) const;

    bool isEmpty() const noexcept
    {
        return m_applicationId.isEmpty() && !m_hasGlob && !m_hasTitle;
    }

private:
    QString m_applicationId;
    QRegularExpression m_glob;
    QRegularExpression m_title;
    bool m_hasGlob = false;
    bool m_hasTitle = false;
};

} // namespace Tessera
