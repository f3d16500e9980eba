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

#include "creator.hpp"

creator::creator(QObject *prnt) : QObject(prnt), isosize(0), busy(false), scanned(false), dtimer(nullptr) {}

creator::~creator()
{
    if(dtimer) delete dtimer;
}

void creator::setiso(cQStr &path)
{
    iso = path,
    isosize = path.isEmpty() ? 0 : lu::fsize(path);
}

void creator::detect(const std::function<void()> &cb)
{
    drvcb = cb;
    rescan();

    if(! dtimer)
    {
        dtimer = new QTimer;

        connect(dtimer,
#if QT_VERSION < QT_VERSION_CHECK(5, 7, 0)
            SIGNAL(timeout()), this, SLOT(rescan())
#else
            &QTimer::timeout, this, &creator::rescan
#endif
            );
    }

    dtimer->start(2000);
}

void creator::rescan()
{
    if(busy) return;
    busy = true;
    QSL dlst;
    lu::readlvdevs(dlst);
    QList<drvinfo> ndrvs;

    for(cQStr &item : dlst)
    {
        QSL vals(item.split('\n'));
        if(vals.count() > 2) ndrvs.append({vals.at(0), vals.at(1), vals.at(2).toULongLong(), vals.value(3) == "iso9660"});
    }

    busy = false;

    if(! scanned || ndrvs != drives)
    {
        drives = ndrvs, scanned = true;
        if(drvcb) drvcb();
    }
}

void creator::restore(cQStr &dev, const std::function<void(bool, cQStr &)> &cb)
{
    busy = true;
    lu::log(lu::Info, tr("Restoring the following drive:") % ' ' % dev);
    bool rv(lu::restore(dev));
    busy = false;
    QStr emsg;
    if(! rv) lu::log(lu::Err, emsg = tr("Unable to restore the following drive:") % ' ' % dev);
    cb(rv, emsg);
    rescan();
}

bool creator::ddimage(cQStr &img, cQStr &dev, const std::function<bool(double)> &prgrss, QStr &emsg)
{
    return lu::ddimage(img, dev, prgrss, emsg);
}
