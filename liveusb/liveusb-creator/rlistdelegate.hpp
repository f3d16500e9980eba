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

#ifndef RLISTDELEGATE_HPP
#define RLISTDELEGATE_HPP

#include "../libliveusb/lulib.hpp"
#include <QStyledItemDelegate>

class rlistdelegate : public QStyledItemDelegate
{
    Q_OBJECT

public:
    inline rlistdelegate(QObject *prnt) : QStyledItemDelegate(prnt) {}

    void paint(QPainter *pntr, const QStyleOptionViewItem &opt, const QModelIndex &idx) const;
    QSize sizeHint(const QStyleOptionViewItem &opt, const QModelIndex &idx) const;
};

#endif
