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

#include "rlistdelegate.hpp"
#include "../libliveusb/rlmodel.hpp"
#include <QTextDocument>
#include <QApplication>
#include <QPainter>

void rlistdelegate::paint(QPainter *pntr, const QStyleOptionViewItem &opt, const QModelIndex &idx) const
{
    release *rls(idx.data(rlmodel::Releaserole).value<release *>());
    if(! rls) return QStyledItemDelegate::paint(pntr, opt, idx);
    pntr->save();

    if(rls->isSeparator())
    {
        QTextDocument doc;
        doc.setDefaultFont(opt.font), doc.setHtml("<b>" % rls->name().toHtmlEscaped() % "</b>");
        pntr->translate(opt.rect.topLeft()), doc.drawContents(pntr, QRectF(0, 0, opt.rect.width(), opt.rect.height()));
        pntr->restore();
        return;
    }

    QStyleOptionViewItem copt(opt);
    initStyleOption(&copt, idx);
    copt.text.clear();
    QApplication::style()->drawControl(QStyle::CE_ItemViewItem, &copt, pntr);
    QRect trct(opt.rect.adjusted(8, 4, -8, -4));
    QFont fnt(opt.font);
    fnt.setBold(true), pntr->setFont(fnt);
    if(opt.state & QStyle::State_Selected) pntr->setPen(opt.palette.highlightedText().color());
    pntr->drawText(trct, Qt::AlignLeft | Qt::AlignTop, rls->name());
    fnt.setBold(false), pntr->setFont(fnt);
    if(! rls->version().isEmpty()) pntr->drawText(trct, Qt::AlignRight | Qt::AlignTop, rls->version());
    pntr->drawText(trct, Qt::AlignLeft | Qt::AlignBottom, opt.fontMetrics.elidedText(rls->summary(), Qt::ElideRight, trct.width()));
    pntr->restore();
}

QSize rlistdelegate::sizeHint(const QStyleOptionViewItem &opt, const QModelIndex &idx) const
{
    release *rls(idx.data(rlmodel::Releaserole).value<release *>());
    if(! rls) return QStyledItemDelegate::sizeHint(opt, idx);
    return QSize(opt.rect.width(), rls->isSeparator() ? opt.fontMetrics.height() * 2 : opt.fontMetrics.height() * 2 + 12);
}
