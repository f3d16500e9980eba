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

#ifndef RLMODEL_HPP
#define RLMODEL_HPP

#include "release.hpp"
#include <QAbstractListModel>
#include <QSortFilterProxyModel>

class LU_EXPORT rlmodel : public QAbstractListModel
{
    Q_OBJECT

public:
    enum { Releaserole = Qt::UserRole + 1 };

    rlmodel(const QList<release *> *rdata, QObject *prnt = nullptr);

    int rowCount(const QModelIndex &prnt = QModelIndex()) const;
    QVariant data(const QModelIndex &idx, int role = Qt::DisplayRole) const;
    QHash<int, QByteArray> roleNames() const;

    void breset(),
         ereset();

private:
    const QList<release *> *rdata;
};

class LU_EXPORT rlproxy : public QSortFilterProxyModel
{
    Q_OBJECT
    Q_PROPERTY(QString nameFilter READ nameFilter WRITE setNameFilter NOTIFY nameFilterChanged)
    Q_PROPERTY(QStringList possibleArchs READ possibleArchs CONSTANT)
    Q_PROPERTY(QString archFilterDetailed READ archFilterDetailed NOTIFY archFilterChanged)
    Q_PROPERTY(QString archFilter READ archFilter WRITE setArchFilter NOTIFY archFilterChanged)
    Q_PROPERTY(bool isFront READ isFront WRITE setIsFront NOTIFY isFrontChanged)

public:
    rlproxy(const QList<release *> *rdata, rlmodel *src, QObject *prnt = nullptr);

    static QSL archnames(),
               archabbrs(cQStr &name);

    static QStr archdetail(cQStr &name);

    QStr nameFilter() const, archFilter() const, archFilterDetailed() const;
    QSL possibleArchs() const;
    bool isFront() const;

    void setNameFilter(cQStr &value),
         setArchFilter(cQStr &value),
         setIsFront(bool value);

    int rowCount(const QModelIndex &prnt = QModelIndex()) const;
    Q_INVOKABLE release *get(int i) const;

signals:
    void archFilterChanged(),
         nameFilterChanged(),
         isFrontChanged();

protected:
    bool filterAcceptsRow(int srow, const QModelIndex &sprnt) const;

private:
    const QList<release *> *rdata;
    mutable QSL afltr;
    QStr nfltr;
    bool front;
};

inline QStr rlproxy::nameFilter() const
{
    return nfltr;
}

inline bool rlproxy::isFront() const
{
    return front;
}

inline QSL rlproxy::possibleArchs() const
{
    return archnames();
}

#endif
