/*
 * Copyright(C) 2015-2016, The LiveUSB Creator developers
 *
 * This file is part of the LiveUSB Creator.
 *
 * The LiveUSB Creator is free software; you can redistribute it and/or modify it
 * under the terms of the GNU General Public License as published by the Free
 * Software Foundation; either version 3 of the License, or (at your option) any
 * later version.
 *
 * The LiveUSB Creator is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 * FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more
 * details.
 *
 * You should have received a copy of the GNU General Public License along with the
 * LiveUSB Creator. If not, see <http://www.gnu.org/licenses>.
 */

#ifndef LUTYPEDEF_HPP
#define LUTYPEDEF_HPP

#include <QStringList>
#include <QTextStream>
#include <functional>

class bstr;

typedef QTextStream QTS;
typedef const QStringList cQSL;
typedef QStringList QSL;
typedef const QString cQStr;
typedef QString QStr;
typedef const QByteArray cQBA;
typedef QByteArray QBA;
typedef const bstr cbstr;
typedef unsigned long long ullong;
typedef long long llong;
typedef const char cchar;
typedef signed char schar;
typedef const std::initializer_list<int> cSIL;

class bstr
{
private:
    QBA ba;

public:
    inline bstr() : data(nullptr) {}
    inline bstr(cchar *txt) : data(txt) {}
    inline bstr(cQStr &txt) : ba(txt.toUtf8()), data(ba.constData()) {}
    inline operator cchar *() const { return data; }

    cchar *data;
};

#endif
