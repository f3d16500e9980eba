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

#include "lvdata.hpp"

lvdata::lvdata(creator *lv, QObject *prnt) : QObject(prnt), lv(lv), rmdl(new rlmodel(&rdata, this)), rprxy(new rlproxy(&rdata, rmdl, this)), uthrd(new updthread(this)), drestore(nullptr), cidx(0), cdrv(0)
{
    catalogue::load();
    fillReleases();
    uthrd->url = lu::burl;
    connect(uthrd, &QThread::finished, this, &lvdata::uthrdstopped);
    lv->detect([this] { drvcallback(); });
    if(lu::updrel == lu::True) QTimer::singleShot(0, uthrd, SLOT(start()));
}

lvdata::~lvdata()
{
    if(uthrd->isRunning()) uthrd->wait();
}

void lvdata::uthrdstopped()
{
    if(uthrd->ok) catalogue::store(uthrd->rlst);
    fillReleases();
    emit updateThreadStopped();
}

void lvdata::fillReleases()
{
    for(release *rls : rdata)
        if(rls->download()->running() || rls->writer()->running()) return;

    rmdl->breset();
    for(release *rls : rdata) rls->deleteLater();
    rdata.clear();
    for(const rinfo &ri : catalogue::flavors(catalogue::releases)) rdata.append(new release(this, rdata.count(), lv, ri));
    rmdl->ereset();
    rprxy->invalidate();
    emit currentImageChanged();
}

void lvdata::drvcallback()
{
    if(drestore && drestore->beingRestored()) return;
    QStr prvdev(cdrv > -1 && cdrv < udrvs.count() ? udrvs.at(cdrv)->drive() : nullptr);

    {
        QList<drvinfo> cdrvs;
        for(usbdrive *drv : udrvs) cdrvs.append(drv->info());
        if(cdrvs == lv->drives) return;
    }

    for(usbdrive *drv : udrvs) drv->deleteLater();
    udrvs.clear();
    for(const drvinfo &info : lv->drives) udrvs.append(new usbdrive(this, info.friendlyName % " (" % lu::dunit(info.size) % ')', info, lv));
    emit usbDrivesChanged();
    drestore = nullptr, cdrv = -1;

    for(int a(0) ; a < udrvs.count() ; ++a)
    {
        if(udrvs.at(a)->drive() == prvdev) cdrv = a;
        if(udrvs.at(a)->info().isIso9660) drestore = udrvs.at(a);
    }

    if(cdrv == -1 && ! udrvs.isEmpty()) cdrv = 0;
    lv->drive = cdrv == -1 ? nullptr : udrvs.at(cdrv)->drive();

    if(lv->drive != prvdev)
        for(release *rls : rdata) rls->writer()->setFinished(false);

    emit currentDriveChanged();
    emit driveToRestoreChanged();
}

void lvdata::setCurrentIndex(int value)
{
    if(cidx != value)
    {
        cidx = value;
        emit currentImageChanged();
    }
}

void lvdata::setCurrentDrive(int value)
{
    if(udrvs.isEmpty())
    {
        lv->drive.clear(), cdrv = -1;
        emit currentDriveChanged();
        return;
    }
    else if(value < 0 || value >= udrvs.count())
        value = 0;

    if(cdrv != value)
    {
        cdrv = value, lv->drive = udrvs.at(cdrv)->drive();
        emit currentDriveChanged();
        for(release *rls : rdata) rls->writer()->setFinished(false);
    }
}

QObjectList lvdata::usbDrives() const
{
    QObjectList olst;
    for(usbdrive *drv : udrvs) olst.append(drv);
    return olst;
}

QSL lvdata::usbDriveNames() const
{
    QSL nlst;
    for(usbdrive *drv : udrvs) nlst.append(drv->text());
    return nlst;
}

QVariantMap lvdata::config() const
{
    QVariantMap cfg;
    cfg.insert("distro", lu::distro),
    cfg.insert("base_url", lu::burl),
    cfg.insert("main_categories", lu::mcats),
    cfg.insert("download_directory", lu::dldir),
    cfg.insert("release_cache", lu::rcache),
    cfg.insert("update_releases", lu::updrel == lu::True),
    cfg.insert("language", lu::lang);
    return cfg;
}
