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

#ifndef CATALOGUE_HPP
#define CATALOGUE_HPP

#include "lulib.hpp"
#include <QMap>

struct LU_EXPORT rvariant {
    QStr url, sha256, filename;
    ullong size;
};

struct LU_EXPORT rinfo {
    QStr name, summary, description, version, releaseDate, logo, source;
    QSL screenshots;
    QMap<QStr, rvariant> variants;
};

class LU_EXPORT catalogue
{
    Q_DECLARE_TR_FUNCTIONS(catalogue)

public:
    static QList<rinfo> releases;

    static QList<rinfo> parse(cQBA &json),
                        flavors(const QList<rinfo> &rlst);

    static QBA serialize(const QList<rinfo> &rlst);
    static ullong sizetxt(cQStr &txt);
    static rinfo local();

    static bool fetch(cQStr &url, QList<rinfo> &rlst, QStr &emsg),
                store(const QList<rinfo> &rlst);

    static void load();

private:
    catalogue();
};

class LU_EXPORT updthread : public QThread
{
    Q_OBJECT

public:
    explicit updthread(QObject *prnt = nullptr);

    QList<rinfo> rlst;
    QStr url, emsg;
    bool ok;

protected:
    void run();
};

#endif
