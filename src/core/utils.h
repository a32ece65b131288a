// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "constants.h"
#include <QDateTime>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QRect>
#include <QString>
#include <QUuid>
#include <optional>

namespace Tessera {
namespace Utils {

/**
 * @brief Generate a new entity id
 *
 * Ids are UUIDs without braces so they can double as file-name fragments.
 */
inline QString generateId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

// ═══════════════════════════════════════════════════════════════════════════════
// JSON Parsing Utilities
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Parse a JSON byte array into a QJsonObject safely
 * @param data UTF-8 JSON text
 * @param errorString Receives the parser message on failure (may be null)
 * @return Optional QJsonObject, empty if invalid or not an object
 */
inline std::optional<QJsonObject> parseJsonObject(const QByteArray& data, QString* errorString = nullptr)
{
    if (data.isEmpty()) {
        if (errorString) {
            *errorString = QStringLiteral("empty document");
        }
        return std::nullopt;
    }
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (errorString) {
            *errorString = parseError.errorString() + QStringLiteral(" at offset ") + QString::number(parseError.offset);
        }
        return std::nullopt;
    }
    if (!doc.isObject()) {
        if (errorString) {
            *errorString = QStringLiteral("document root is not an object");
        }
        return std::nullopt;
    }
    return doc.object();
}

inline QJsonObject rectToJson(const QRect& rect)
{
    QJsonObject json;
    json[JsonKeys::X] = rect.x();
    json[JsonKeys::Y] = rect.y();
    json[JsonKeys::Width] = rect.width();
    json[JsonKeys::Height] = rect.height();
    return json;
}

inline QRect rectFromJson(const QJsonValue& value)
{
    if (!value.isObject()) {
        return QRect();
    }
    const QJsonObject json = value.toObject();
    return QRect(json[JsonKeys::X].toInt(), json[JsonKeys::Y].toInt(), json[JsonKeys::Width].toInt(),
                 json[JsonKeys::Height].toInt());
}

// Timestamps are stored as ISO 8601 UTC with milliseconds
inline QString dateTimeToJson(const QDateTime& dateTime)
{
    return dateTime.isValid() ? dateTime.toUTC().toString(Qt::ISODateWithMs) : QString();
}

inline QDateTime dateTimeFromJson(const QJsonValue& value)
{
    const QString text = value.toString();
    if (text.isEmpty()) {
        return QDateTime();
    }
    return QDateTime::fromString(text, Qt::ISODateWithMs);
}

} // namespace Utils
} // namespace Tessera
