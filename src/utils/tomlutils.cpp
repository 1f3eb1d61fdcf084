/*
 * Copyright (C) 2024 Matthias Klumpp <matthias@tenstral.net>
 *
 * Licensed under the GNU Lesser General Public License Version 3
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation, either version 3 of the license, or
 * (at your option) any later version.
 *
 * This software is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this software.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "tomlutils.h"

#include <sstream>
#include <toml++/toml.h>
#include <QDebug>

using namespace DevIO;

/**
 * Store a simple (non-container) QVariant value using the given insertion
 * function. Returns false if the type is not representable in TOML.
 */
template<typename InsertFunc>
static bool insertSimpleVariant(InsertFunc &&insert, const QVariant &var)
{
    switch (var.typeId()) {
    case QMetaType::Bool:
        insert(var.toBool());
        return true;
    case QMetaType::QString:
    case QMetaType::QByteArray:
        insert(var.toString().toStdString());
        return true;
    case QMetaType::Int:
    case QMetaType::UInt:
    case QMetaType::Long:
    case QMetaType::LongLong:
    case QMetaType::Short:
        insert(var.value<int64_t>());
        return true;
    case QMetaType::Double:
    case QMetaType::Float:
        insert(var.toDouble());
        return true;
    default:
        break;
    }

    // check Qt knows how to convert the unknown value to a string representation
    if (var.canConvert<QString>()) {
        insert(var.toString().toStdString());
        return true;
    }

    return false;
}

static toml::table qVariantHashToTomlTable(const QVariantHash &varHash);

static toml::array qVariantListToTomlArray(const QVariantList &varList)
{
    toml::array arr;
    for (const auto &var : varList) {
        if (var.isNull())
            continue;

        if (var.typeId() == QMetaType::QVariantHash) {
            arr.push_back(qVariantHashToTomlTable(var.toHash()));
            continue;
        }

        if (var.typeId() == QMetaType::QVariantList || var.typeId() == QMetaType::QStringList) {
            arr.push_back(qVariantListToTomlArray(var.toList()));
            continue;
        }

        if (insertSimpleVariant([&](auto v) { arr.push_back(v); }, var))
            continue;

        qWarning().noquote()
            << QStringLiteral("Unable to store type `%1` in TOML attributes (array).").arg(var.typeName());
    }

    return arr;
}

static toml::table qVariantHashToTomlTable(const QVariantHash &varHash)
{
    toml::table tab;

    QHashIterator<QString, QVariant> i(varHash);
    while (i.hasNext()) {
        i.next();
        const auto var = i.value();
        const auto key = i.key().toStdString();

        // TOML has no null value, leave it out
        if (var.isNull())
            continue;

        if (var.typeId() == QMetaType::QVariantHash) {
            tab.insert(key, qVariantHashToTomlTable(var.toHash()));
            continue;
        }

        if (var.typeId() == QMetaType::QVariantList || var.typeId() == QMetaType::QStringList) {
            tab.insert(key, qVariantListToTomlArray(var.toList()));
            continue;
        }

        if (insertSimpleVariant([&](auto v) { tab.insert(key, v); }, var))
            continue;

        qWarning().noquote()
            << QStringLiteral("Unable to store type `%1` in TOML attributes (table).").arg(var.typeName());
    }

    return tab;
}

static QString serializeTomlTable(const toml::table &tab)
{
    std::stringstream data;
    data << tab;
    return QString::fromStdString(data.str());
}

QByteArray DevIO::qVariantHashToTomlData(const QVariantHash &varHash)
{
    const auto tab = qVariantHashToTomlTable(varHash);
    const auto result = serializeTomlTable(tab) + "\n";
    return result.toUtf8();
}

static QVariant tomlNodeToVariant(const toml::node &node)
{
    QVariant res;
    node.visit([&](auto &&n) {
        if constexpr (toml::is_string<decltype(n)>)
            res = QVariant::fromValue(QString::fromStdString(n.get()));
        else if constexpr (toml::is_integer<decltype(n)>)
            res = QVariant::fromValue(static_cast<qint64>(n.get()));
        else if constexpr (toml::is_floating_point<decltype(n)>)
            res = QVariant::fromValue(n.get());
        else if constexpr (toml::is_boolean<decltype(n)>)
            res = QVariant::fromValue(n.get());

        else if constexpr (toml::is_array<decltype(n)>) {
            QVariantList vList;
            for (auto &e : n)
                vList.append(tomlNodeToVariant(e));
            res = vList;
        }

        else if constexpr (toml::is_table<decltype(n)>) {
            QVariantHash vHash;
            for (auto &&[tk, tv] : n)
                vHash.insert(QString::fromUtf8(tk.data(), tk.length()), tomlNodeToVariant(tv));
            res = vHash;
        }

        // dates and times are not used in our configuration
    });

    return res;
}

static QVariantHash tomlToVariantHash(const toml::table &tab)
{
    QVariantHash res;
    for (auto &&[k, v] : tab)
        res.insert(QString::fromUtf8(k.data(), k.length()), tomlNodeToVariant(v));

    return res;
}

QVariantHash DevIO::parseTomlData(const QByteArray &data, QString &errorMessage)
{
    toml::table table;
    errorMessage = QString();

    try {
        table = toml::parse(data.toStdString());
    } catch (const toml::parse_error &e) {
        std::stringstream error;
        error << e;
        errorMessage = QString::fromStdString(error.str());
        return QVariantHash();
    }

    return tomlToVariantHash(table);
}

QVariantHash DevIO::parseTomlFile(const QString &fname, QString &errorMessage)
{
    toml::table table;
    errorMessage = QString();

    try {
        table = toml::parse_file(fname.toStdString());
    } catch (const toml::parse_error &e) {
        std::stringstream error;
        error << e;
        errorMessage = QString::fromStdString(error.str());
        return QVariantHash();
    }

    return tomlToVariantHash(table);
}
