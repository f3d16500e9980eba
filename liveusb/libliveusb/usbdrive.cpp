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

#include "usbdrive.hpp"
#include <QPointer>

usbdrive::usbdrive(QObject *prnt, cQStr &name, const drvinfo &info, creator *lv) : QObject(prnt), lv(lv), dinfo(info), name(name), rstrng(false) {}

void usbdrive::restore()
{
    if(rstrng) return;
    rstrng = true;
    emit beingRestoredChanged();
    QStr dev(dinfo.device);
    QPointer<usbdrive> self(this);

    lv->restore(dev, [self](bool, cQStr &) {
            if(self)
            {
                self->rstrng = false;
                emit self->beingRestoredChanged();
            }
        });
}
