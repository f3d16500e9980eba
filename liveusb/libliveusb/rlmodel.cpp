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

#include "rlmodel.hpp"

rlmodel::rlmodel(const QList<release *> *rdata, QObject *prnt) : QAbstractListModel(prnt), rdata(rdata) {}

int rlmodel::rowCount(const QModelIndex &prnt) const
{
    return prnt.isValid() ? 0 : rdata->count();
}

QVariant rlmodel::data(const QModelIndex &idx, int role) const
{
    if(! idx.isValid() || idx.row() >= rdata->count()) return QVariant();

    switch(role) {
    case Releaserole:
        return QVariant::fromValue(rdata->at(idx.row()));
    case Qt::DisplayRole:
        return rdata->at(idx.row())->name();
    default:
        return QVariant();
    }
}

QHash<int, QByteArray> rlmodel::roleNames() const
{
    QHash<int, QByteArray> roles;
    roles.insert(Releaserole, "release");
    return roles;
}

void rlmodel::breset()
{
    beginResetModel();
}

void rlmodel::ereset()
{
    endResetModel();
}

rlproxy::rlproxy(const QList<release *> *rdata, rlmodel *src, QObject *prnt) : QSortFilterProxyModel(prnt), rdata(rdata), afltr(archabbrs("Intel 64bit")), front(true)
{
    setSourceModel(src);
}

QSL rlproxy::archnames()
{
    return {"Intel 64bit", "Intel 32bit"};
}

QSL rlproxy::archabbrs(cQStr &name)
{
    return name == "Intel 64bit" ? QSL{"x86_64"} : name == "Intel 32bit" ? QSL{"i686", "i386"} : QSL();
}

QStr rlproxy::archdetail(cQStr &name)
{
    return name == "Intel 64bit" ? tr("ISO format image for Intel, AMD and other compatible PCs (64-bit)")
        : name == "Intel 32bit" ? tr("ISO format image for Intel, AMD and other compatible PCs (32-bit)")
        : nullptr;
}

QStr rlproxy::archFilter() const
{
    for(cQStr &name : archnames())
        if(archabbrs(name) == afltr) return name;

    afltr = archabbrs("Intel 64bit");
    return "Intel 64bit";
}

QStr rlproxy::archFilterDetailed() const
{
    return archdetail(archFilter());
}

void rlproxy::setNameFilter(cQStr &value)
{
    if(nfltr != value)
    {
        nfltr = value;
        emit nameFilterChanged();
        invalidateFilter();
    }
}

void rlproxy::setArchFilter(cQStr &value)
{
    if(archnames().contains(value) && archFilter() != value)
    {
        afltr = archabbrs(value);
        emit archFilterChanged();
        invalidateFilter();
    }
}

void rlproxy::setIsFront(bool value)
{
    if(front != value)
    {
        front = value;
        emit isFrontChanged();
        invalidate();
    }
}

int rlproxy::rowCount(const QModelIndex &prnt) const
{
    int rcnt(QSortFilterProxyModel::rowCount(prnt));
    return front && rcnt > 3 ? 3 : rcnt;
}

release *rlproxy::get(int i) const
{
    return i < 0 || i >= rdata->count() ? nullptr : rdata->at(i);
}

bool rlproxy::filterAcceptsRow(int srow, const QModelIndex &sprnt) const
{
    release *rls(sourceModel()->index(srow, 0, sprnt).data(rlmodel::Releaserole).value<release *>());
    if(! rls) return false;

    return (afltr.isEmpty() || rls->isLocal() || rls->arch().contains(archFilter()) || rls->isSeparator())
        && (nfltr.isEmpty() || ! rls->isSeparator())
        && (nfltr.isEmpty() || rls->name().contains(nfltr, Qt::CaseInsensitive) || rls->summary().contains(nfltr, Qt::CaseInsensitive));
}
