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

#ifndef CREATOR_HPP
#define CREATOR_HPP

#include "lulib.hpp"
#include <QTimer>
#include <QList>

struct LU_EXPORT drvinfo {
    QStr device, friendlyName;
    ullong size;
    bool isIso9660;

    bool operator==(const drvinfo &drv) const;
    bool operator!=(const drvinfo &drv) const;
};

class LU_EXPORT creator : public QObject
{
    Q_OBJECT

public:
    explicit creator(QObject *prnt = nullptr);
    virtual ~creator();

    QList<drvinfo> drives;
    QStr drive, iso;
    ullong isosize;

    void setiso(cQStr &path);

    virtual void detect(const std::function<void()> &cb),
                 restore(cQStr &dev, const std::function<void(bool, cQStr &)> &cb);

    virtual bool ddimage(cQStr &img, cQStr &dev, const std::function<bool(double)> &prgrss, QStr &emsg);

public slots:
    virtual void rescan();

protected:
    std::function<void()> drvcb;
    bool busy, scanned;

private:
    QTimer *dtimer;
};

inline bool drvinfo::operator==(const drvinfo &drv) const
{
    return device == drv.device && friendlyName == drv.friendlyName && size == drv.size && isIso9660 == drv.isIso9660;
}

inline bool drvinfo::operator!=(const drvinfo &drv) const
{
    return ! (*this == drv);
}

#endif
