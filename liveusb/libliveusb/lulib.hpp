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

#ifndef LULIB_HPP
#define LULIB_HPP

#include "lulib_global.hpp"
#include "lutypedef.hpp"
#include <QCoreApplication>
#include <QStringBuilder>
#include <QTranslator>
#include <QFileInfo>
#include <QThread>
#include <QFile>
#include <sys/stat.h>
#include <unistd.h>

#define fnln __attribute__((always_inline))
#define dcfgfile "/etc/liveusb-creator/liveusb-creator.conf"

class LU_EXPORT lu : public QThread
{
    Q_DECLARE_TR_FUNCTIONS(liveusb)

public:
    enum { Sync = 0, Umount = 1, Readlvdevs = 2, Mkptable = 3, Mkpart = 4,
           Nodbg = 0, Errdbg = 1, Alldbg = 2, Extdbg = 3, Cextdbg = 4, Nulldbg = 5, Falsedbg = 6,
           Notexist = 0, Isfile = 1, Isdir = 2, Islink = 3, Isblock = 4, Unknown = 5,
           Noflag = 0, Silent = 1,
           Info = 0, Warn = 1, Err = 2,
           False = 0, True = 1, Empty = 2 };

    static lu LUThrd;
    static QStr ThrdStr[2], eout, cfgpath, distro, burl, dldir, rcache, lang;
    static QSL mcats;
    static std::function<void(uchar, cQStr &)> logcb;
    static uchar dbglev, updrel;

    static fnln QStr hunit(ullong size),
                     dunit(ullong size);

    static QStr mid(cQStr &txt, ushort start, ushort len),
                right(cQStr &txt, short len),
                left(cQStr &txt, short len),
                fmt(cQStr &txt),
                appver(),
                dbginf();

    static QBA fload(cQStr &path);
    static ullong devsize(cQStr &dev);
    static fnln ullong fsize(cQStr &path);

    static fnln ushort instr(cQStr &txt, cQStr &stxt, ushort start = 1),
                       rinstr(cQStr &txt, cQStr &stxt);

    template<typename T> static uchar stype(const T &path, bool flink = false);

    static uchar exec(cQStr &cmd, uchar flag = Noflag);

    template<typename T> static fnln bool crtdir(const T &path);

    static fnln bool islink(cQStr &path),
                     isfile(cQStr &path),
                     isdir(cQStr &path);

    static bool mkpart(cQStr &dev, ullong start = 0, ullong len = 0),
                mcheck(cQStr &item, cQStr &mnts = fload("/proc/self/mounts")),
                like(cQStr &txt, cQSL &lst),
                ddimage(cQStr &img, cQStr &dev, const std::function<bool(double)> &prgrss, QStr &emsg),
                mkptable(cQStr &dev, cQStr &type = "msdos"),
                crtfile(cQStr &path, cQStr &txt = nullptr),
                like(int num, cSIL &lst),
                error(QStr txt, bool dbg = false),
                cfgwrite(cQStr &file = cfgpath),
                fopen(QFile &file),
                umount(cQStr &dev),
                umntall(cQStr &dev),
                restore(cQStr &dev),
                isnum(cQStr &txt),
                lock();

    static void readlvdevs(QSL &strlst),
                log(uchar type, cQStr &txt),
                unlock(),
                delay(ushort msec),
                print(cQStr &txt),
                thrdelay(),
                cfgread(),
                fssync(),
                ldtltr();

protected:
    void run();

private:
    lu();
    ~lu();

    static QTranslator *LUtr;
    static QSL *ThrdSlst;
    static ullong ThrdLng[2];
    static int lulock;
    static uchar ThrdType;
    static bool ThrdRslt, dldflt;

    static QStr fdbg(cQStr &path),
                rlink(cQStr &path, ushort blen);

    static bool umnt(cbstr &dev);
};

inline QStr lu::left(cQStr &txt, short len)
{
    return txt.length() > qAbs(len) ? txt.left(len > 0 ? len : txt.length() + len) : len > 0 ? txt : nullptr;
}

inline QStr lu::right(cQStr &txt, short len)
{
    return txt.length() > qAbs(len) ? txt.right(len > 0 ? len : txt.length() + len) : len > 0 ? txt : nullptr;
}

inline QStr lu::mid(cQStr &txt, ushort start, ushort len)
{
    return txt.length() >= start ? txt.length() - start + 1 > len ? txt.mid(start - 1, len) : txt.right(txt.length() - start + 1) : nullptr;
}

inline ushort lu::instr(cQStr &txt, cQStr &stxt, ushort start)
{
    return txt.indexOf(stxt, start - 1) + 1;
}

inline ushort lu::rinstr(cQStr &txt, cQStr &stxt)
{
    return txt.lastIndexOf(stxt) + 1;
}

inline bool lu::like(int num, cSIL &lst)
{
    for(int val : lst)
        if(num == val) return true;

    return false;
}

inline bool lu::islink(cQStr &path)
{
    return QFileInfo(path).isSymLink();
}

inline bool lu::isfile(cQStr &path)
{
    return QFileInfo(path).isFile();
}

inline bool lu::isdir(cQStr &path)
{
    return QFileInfo(path).isDir();
}

template<typename T> inline uchar lu::stype(const T &path, bool flink)
{
    struct stat istat;
    if(flink ? stat(bstr(path), &istat) : lstat(bstr(path), &istat)) return Notexist;

    switch(istat.st_mode & S_IFMT) {
    case S_IFREG:
        return Isfile;
    case S_IFDIR:
        return Isdir;
    case S_IFLNK:
        return Islink;
    case S_IFBLK:
        return Isblock;
    default:
        return Unknown;
    }
}

inline ullong lu::fsize(cQStr &path)
{
    return QFileInfo(path).size();
}

inline QStr lu::hunit(ullong size)
{
    return size < 1024 ? QStr(QStr::number(size) % " B") : size < 1048576 ? QStr::number(qRound64(size * 100.0 / 1024.0) / 100.0) % " KiB" : size < 1073741824 ? QStr::number(qRound64(size * 100.0 / 1024.0 / 1024.0) / 100.0) % " MiB" : size < 1073741824000 ? QStr::number(qRound64(size * 100.0 / 1024.0 / 1024.0 / 1024.0) / 100.0) % " GiB" : QStr::number(qRound64(size * 100.0 / 1024.0 / 1024.0 / 1024.0 / 1024.0) / 100.0) % " TiB";
}

inline QStr lu::dunit(ullong size)
{
    return size < 1000ULL ? QStr(QStr::number(double(size), 'f', 1) % " B") : size < 1000000ULL ? QStr::number(size / 1000.0, 'f', 1) % " KB" : size < 1000000000ULL ? QStr::number(size / 1000000.0, 'f', 1) % " MB" : size < 1000000000000ULL ? QStr::number(size / 1000000000.0, 'f', 1) % " GB" : QStr::number(size / 1000000000000.0, 'f', 1) % " TB";
}

template<typename T> inline bool lu::crtdir(const T &path)
{
    return mkdir(bstr(path), 0755) ? error("\n " % tr("An error occurred while creating the following directory:") % "\n\n  " % path % fdbg(path), true) : true;
}

inline bool lu::isnum(cQStr &txt)
{
    for(uchar a(0) ; a < txt.length() ; ++a)
        if(! txt.at(a).isDigit()) return false;

    return ! txt.isEmpty();
}

#endif
