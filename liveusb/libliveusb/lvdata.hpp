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

#ifndef LVDATA_HPP
#define LVDATA_HPP

#include "rlmodel.hpp"
#include "usbdrive.hpp"
#include <QVariantMap>

class LU_EXPORT lvdata : public QObject
{
    Q_OBJECT
    Q_PROPERTY(rlmodel *releaseModel READ releaseModel NOTIFY releasesChanged)
    Q_PROPERTY(rlproxy *releaseProxyModel READ releaseProxyModel NOTIFY releasesChanged)
    Q_PROPERTY(int currentIndex READ currentIndex WRITE setCurrentIndex NOTIFY currentImageChanged)
    Q_PROPERTY(release *currentImage READ currentImage NOTIFY currentImageChanged)
    Q_PROPERTY(usbdrive *driveToRestore READ driveToRestore NOTIFY driveToRestoreChanged)
    Q_PROPERTY(QObjectList usbDrives READ usbDrives NOTIFY usbDrivesChanged)
    Q_PROPERTY(QStringList usbDriveNames READ usbDriveNames NOTIFY usbDrivesChanged)
    Q_PROPERTY(int currentDrive READ currentDrive WRITE setCurrentDrive NOTIFY currentDriveChanged)
    Q_PROPERTY(QVariantMap config READ config NOTIFY configChanged)

public:
    explicit lvdata(creator *lv, QObject *prnt = nullptr);
    ~lvdata();

    rlmodel *releaseModel() const;
    rlproxy *releaseProxyModel() const;
    release *currentImage() const;
    usbdrive *driveToRestore() const;
    QObjectList usbDrives() const;
    QSL usbDriveNames() const;
    QVariantMap config() const;
    int currentIndex() const, currentDrive() const;
    const QList<release *> &releases() const;
    const QList<usbdrive *> &drives() const;

    void setCurrentIndex(int value),
         setCurrentDrive(int value);

public slots:
    void fillReleases();

signals:
    void releasesChanged(),
         currentImageChanged(),
         usbDrivesChanged(),
         currentDriveChanged(),
         driveToRestoreChanged(),
         updateThreadStopped(),
         configChanged();

private:
    creator *lv;
    rlmodel *rmdl;
    rlproxy *rprxy;
    updthread *uthrd;
    usbdrive *drestore;
    QList<release *> rdata;
    QList<usbdrive *> udrvs;
    int cidx, cdrv;

    void drvcallback();

private slots:
    void uthrdstopped();
};

inline rlmodel *lvdata::releaseModel() const
{
    return rmdl;
}

inline rlproxy *lvdata::releaseProxyModel() const
{
    return rprxy;
}

inline release *lvdata::currentImage() const
{
    return cidx > -1 && cidx < rdata.count() ? rdata.at(cidx) : nullptr;
}

inline usbdrive *lvdata::driveToRestore() const
{
    return drestore;
}

inline int lvdata::currentIndex() const
{
    return cidx;
}

inline int lvdata::currentDrive() const
{
    return cdrv;
}

inline const QList<release *> &lvdata::releases() const
{
    return rdata;
}

inline const QList<usbdrive *> &lvdata::drives() const
{
    return udrvs;
}

#endif
