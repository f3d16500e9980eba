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

#ifndef USBDRIVE_HPP
#define USBDRIVE_HPP

#include "creator.hpp"

class LU_EXPORT usbdrive : public QObject
{
    Q_OBJECT
    Q_PROPERTY(QString text READ text CONSTANT)
    Q_PROPERTY(QString drive READ drive CONSTANT)
    Q_PROPERTY(bool beingRestored READ beingRestored NOTIFY beingRestoredChanged)

public:
    usbdrive(QObject *prnt, cQStr &name, const drvinfo &info, creator *lv);

    QStr text() const, drive() const;
    const drvinfo &info() const;
    bool beingRestored() const;

    Q_INVOKABLE void restore();

signals:
    void beingRestoredChanged();

private:
    creator *lv;
    drvinfo dinfo;
    QStr name;
    bool rstrng;
};

inline QStr usbdrive::text() const
{
    return name;
}

inline QStr usbdrive::drive() const
{
    return dinfo.device;
}

inline const drvinfo &usbdrive::info() const
{
    return dinfo;
}

inline bool usbdrive::beingRestored() const
{
    return rstrng;
}

#endif
