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

#include "lulib.hpp"
#include <QElapsedTimer>
#include <QProcess>
#include <QLocale>
#include <QDir>
#include <parted/parted.h>
#include <libmount/libmount.h>
#include <blkid/blkid.h>
#include <sys/ioctl.h>
#include <linux/fs.h>
#include <fcntl.h>
#include <errno.h>

#ifndef LU_VERSION
#define LU_VERSION "1.0"
#endif

#ifdef bool
#undef bool
#endif

QTranslator *lu::LUtr(nullptr);
QSL *lu::ThrdSlst, lu::mcats;
QStr lu::ThrdStr[2], lu::eout, lu::cfgpath, lu::distro, lu::burl, lu::dldir, lu::rcache, lu::lang;
std::function<void(uchar, cQStr &)> lu::logcb;
ullong lu::ThrdLng[]{0, 0};
int lu::lulock(-1);
uchar lu::ThrdType, lu::dbglev, lu::updrel(lu::Empty);
bool lu::ThrdRslt, lu::dldflt(false);
lu lu::LUThrd;

lu::lu()
{
    qputenv("PATH", "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin");
    if(! qEnvironmentVariableIsEmpty("LUCONF")) cfgpath = qgetenv("LUCONF");

    dbglev = qEnvironmentVariableIsEmpty("DBGLEV") ? Nulldbg : [] {
            bool ok;

            switch(qgetenv("DBGLEV").toUShort(&ok)) {
            case Errdbg:
                return Nulldbg;
            case Alldbg:
                return Alldbg;
            case Extdbg:
                return Extdbg;
            case Nodbg:
                if(ok) return Nodbg;
            default:
                return Falsedbg;
            }
        }();
}

lu::~lu()
{
    if(LUtr) delete LUtr;
}

void lu::ldtltr()
{
    QTranslator *tltr(new QTranslator);
    cfgread();

    if(lang == "auto")
    {
        if(QLocale::system().name() != "en_EN") tltr->load(QLocale::system(), "liveusb-creator", "_", "/usr/share/liveusb-creator/lang");
    }
    else if(lang != "en_EN")
        tltr->load("liveusb-creator_" % lang, "/usr/share/liveusb-creator/lang");

    if(tltr->isEmpty())
        delete tltr;
    else
        qApp->installTranslator(LUtr = tltr);

    switch(dbglev) {
    case Falsedbg:
        error("\n " % tr("The specified debug level is invalid!") % "\n\n " % tr("The default level (1) will be used.") % "\n\n"),
        dbglev = Nulldbg;
        break;
    case Extdbg:
        QTS(stderr) << (isatty(fileno(stderr)) ? "\033[1;31m" % dbginf() % "\033[0m" : right(dbginf().replace("\n ", "\n"), -1));
    }
}

void lu::print(cQStr &txt)
{
    QTS(stdout) << (isatty(fileno(stdout)) ? "\033[1m" % txt % "\033[0m" : QStr(txt).replace("\n ", "\n"));
}

bool lu::error(QStr txt, bool dbg)
{
    auto splt([](cQStr &stxt) {
            if(stxt.length() < 81) return stxt;
            QStr ftxt;
            QSL llst(stxt.split('\n'));

            for(uchar a(1) ; a < llst.count() ; ++a)
            {
                cQStr &line(llst.at(a));
                ftxt.append('\n' % (line.length() > 79 && ! line.contains(": /") ? QStr(line).replace(line.left(79).lastIndexOf(' '), 0, '\n') : line));
            }

            return ftxt;
        });

    if(! dbg) goto print;

    switch(dbglev) {
    case Errdbg:
    case Cextdbg:
        eout.append(isatty(fileno(stderr)) ? splt(txt) : splt(txt).replace("\n ", "\n"));
        break;
    case Alldbg:
    case Extdbg:
    print:
        QTS(stderr) << (isatty(fileno(stderr)) ? "\033[1;31m" % splt(txt) % "\033[0m" : splt(txt).replace("\n ", "\n"));
    }

    return false;
}

void lu::log(uchar type, cQStr &txt)
{
    if(logcb) logcb(type, txt);

    switch(type) {
    case Info:
        if(like(dbglev, {Alldbg, Extdbg})) print("\n " % txt % "\n\n");
        break;
    case Warn:
        error("\n " % tr("Warning:") % ' ' % txt % "\n\n", true);
        break;
    default:
        error("\n " % txt % "\n\n", true);
    }
}

QStr lu::fmt(cQStr &txt)
{
    return QStr(txt).replace("{DISTRO}", distro);
}

QStr lu::appver()
{
    QStr vrsn(qVersion());

    return LU_VERSION % QStr("_Qt") % (vrsn == QT_VERSION_STR ? vrsn : vrsn % '(' % QT_VERSION_STR % ')') % '_' %
#ifdef __clang__
        "Clang" % QStr::number(__clang_major__) % '.' % QStr::number(__clang_minor__) % '.' % QStr::number(__clang_patchlevel__)
#elif defined(__INTEL_COMPILER) || ! defined(__GNUC__)
        "compiler?"
#elif defined(__GNUC__)
        "GCC" % QStr::number(__GNUC__) % '.' % QStr::number(__GNUC_MINOR__) % '.' % QStr::number(__GNUC_PATCHLEVEL__)
#endif
        % '_' %
#ifdef __amd64__
        "amd64";
#elif defined(__i386__)
        "i386";
#elif defined(__aarch64__)
        "arm64";
#else
        "arch?";
#endif
}

QStr lu::dbginf()
{
    return "\n LiveUSB Creator\n\n " % tr("Version:") % ' ' % appver() % "\n " % tr("Compilation date and time:") % ' ' % __DATE__ % ' ' % __TIME__ % "\n " % tr("Configuration file:") % ' ' % cfgpath % "\n " % tr("Operating system:") % []() -> QStr {
            QFile file("/etc/os-release");

            if(file.open(QIODevice::ReadOnly))
                while(! file.atEnd())
                {
                    QStr cline(file.readLine().trimmed());
                    if(cline.startsWith("PRETTY_NAME=\"")) return ' ' % mid(cline, 14, cline.length() - 14);
                }

            return " ?";
        }() % "\n " % tr("Distribution:") % ' ' % distro % "\n " % tr("Metadata URL:") % ' ' % burl % "\n\n";
}

QStr lu::fdbg(cQStr &path)
{
    switch(dbglev) {
    default:
        return "\n\n";
    case Extdbg:
    case Cextdbg:
        int cerrno(errno);
        struct stat istat;

        return "\n\n " % path % "\n  " % (lstat(bstr(path), &istat) ? QStr('-') : [&istat]() -> QStr {
                switch(istat.st_mode & S_IFMT) {
                case S_IFREG:
                    return "f " % QStr::number(istat.st_mode & 07777, 8) % ' ' % QStr::number(istat.st_uid) % ' ' % QStr::number(istat.st_gid) % ' ' % hunit(istat.st_size).remove(' ');
                case S_IFDIR:
                    return "d " % QStr::number(istat.st_mode & 07777, 8) % ' ' % QStr::number(istat.st_uid) % ' ' % QStr::number(istat.st_gid);
                case S_IFLNK:
                    return "l " % QStr::number(istat.st_uid) % ' ' % QStr::number(istat.st_gid);
                case S_IFBLK:
                    return "b " % QStr::number(istat.st_mode & 07777, 8) % ' ' % QStr::number(istat.st_uid) % ' ' % QStr::number(istat.st_gid);
                default:
                    return "?";
                }
            }()) % "\n\n Errno: " % QStr::number(cerrno) % " (" % QStr::fromLocal8Bit(strerror(cerrno)) % ")\n\n";
    }
}

bool lu::fopen(QFile &file)
{
    return file.open(QIODevice::ReadOnly) ? true : error("\n " % tr("An error occurred while opening the following file:") % "\n\n  " % file.fileName() % fdbg(file.fileName()), true);
}

bool lu::like(cQStr &txt, cQSL &lst)
{
    for(cQStr &stxt : lst)
    {
        QStr ptrn(stxt.mid(1, stxt.length() - 2));
        if(stxt.startsWith('*') ? stxt.endsWith('*') ? txt.contains(ptrn) : txt.endsWith(ptrn) : stxt.endsWith('*') ? txt.startsWith(ptrn) : txt == ptrn) return true;
    }

    return false;
}

QBA lu::fload(cQStr &path)
{
    QFile file(path);
    if(! fopen(file)) return nullptr;
    return file.readAll();
}

bool lu::crtfile(cQStr &path, cQStr &txt)
{
    auto err([&] { return error("\n " % tr("An error occurred while creating the following file:") % "\n\n  " % path % fdbg(path), true); });
    uchar otp(stype(path));
    if(! (like(otp, {Notexist, Isfile}) && isdir(left(path, rinstr(path, "/") - 1)))) return err();
    QFile file(path);
    if(! file.open(QFile::WriteOnly | QFile::Truncate) || file.write(txt.toUtf8()) == -1) return err();
    file.flush();
    return otp == Isfile || file.setPermissions(QFile::ReadOwner | QFile::WriteOwner | QFile::ReadGroup | QFile::ReadOther) ? true : err();
}

bool lu::lock()
{
    return (lulock = open(isdir("/run") ? "/run/liveusb-creator.lock" : "/var/run/liveusb-creator.lock", O_RDWR | O_CREAT, 0644)) > -1 && ! lockf(lulock, F_TLOCK, 0);
}

void lu::unlock()
{
    if(lulock > -1) close(lulock), lulock = -1;
}

void lu::delay(ushort msec)
{
    QElapsedTimer time;
    time.start();
    do msleep(10), qApp->processEvents();
    while(time.elapsed() < msec);
}

void lu::thrdelay()
{
    while(LUThrd.isRunning()) msleep(10), qApp->processEvents();
}

bool lu::cfgwrite(cQStr &file)
{
    return crtfile(file, "# Distribution settings\n#  distro=<name>\n#  base_url=<http(s)/file url of the release metadata>\n#  main_categories=<source,list>\n\n"
        "distro=" % distro %
        "\nbase_url=" % burl %
        "\nmain_categories=" % mcats.join(',') %
        "\n\n\n# Download settings\n#  download_directory=<path>\n#  release_cache=<path>\n#  update_releases=[true/false]\n\n"
        "download_directory=" % (dldflt ? QStr() : dldir) %
        "\nrelease_cache=" % rcache %
        "\nupdate_releases=" % (updrel ? "true" : "false") %
        "\n\n\n# User interface settings\n#  language=[auto/<language_COUNTRY>]\n\n"
        "language=" % lang % '\n');
}

void lu::cfgread()
{
    if(cfgpath.isEmpty()) cfgpath = dcfgfile;
    distro.clear(), burl.clear(), dldir.clear(), rcache.clear(), lang.clear(), mcats.clear(), updrel = Empty, dldflt = false;

    {
        QStr cdir(left(cfgpath, rinstr(cfgpath, "/") - 1));

        if(! isdir(cdir))
        {
            if(! cdir.isEmpty()) crtdir(cdir);
        }
        else if(isfile(cfgpath))
        {
            QFile file(cfgpath);

            if(fopen(file))
                while(! file.atEnd())
                {
                    QStr cline(file.readLine().trimmed()), cval(right(cline, -instr(cline, "=")));

                    if(! (cval.isEmpty() || cline.startsWith('#')))
                    {
                        if(cline.startsWith("distro="))
                            distro = cval;
                        else if(cline.startsWith("base_url="))
                            burl = cval;
                        else if(cline.startsWith("main_categories="))
                        {
                            for(cQStr &cat : cval.split(','))
                                if(! cat.trimmed().isEmpty()) mcats.append(cat.trimmed());
                        }
                        else if(cline.startsWith("download_directory="))
                            dldir = cval;
                        else if(cline.startsWith("release_cache="))
                            rcache = cval;
                        else if(cline.startsWith("update_releases="))
                        {
                            if(cval == "true")
                                updrel = True;
                            else if(cval == "false")
                                updrel = False;
                        }
                        else if(cline.startsWith("language="))
                            lang = cval;
                    }
                }
        }
    }

    bool cfgupdt(false);

    if(distro.isEmpty() || distro.contains('{'))
        distro = "Fedora", cfgupdt = true;

    if(! like(burl, {"_http://*", "_https://*", "_file://*"}))
        burl = "https://getfedora.org/releases.json", cfgupdt = true;

    if(mcats.isEmpty())
        mcats.append(distro), cfgupdt = true;

    if(dldir.isEmpty())
        dldir = QDir::homePath() % "/Downloads", dldflt = true;
    else
    {
        QStr cpath(QDir::cleanPath(dldir));
        if(dldir != cpath) dldir = cpath, cfgupdt = true;
    }

    if(rcache.isEmpty())
        rcache = "/var/cache/liveusb-creator/releases.json", cfgupdt = true;
    else
    {
        QStr cpath(QDir::cleanPath(rcache));
        if(rcache != cpath) rcache = cpath, cfgupdt = true;
    }

    if(updrel == Empty)
        updrel = True, cfgupdt = true;

    if(lang.isEmpty() || ! (lang == "auto" || (lang.length() == 5 && lang.at(2) == '_' && lang.at(0).isLower() && lang.at(1).isLower() && lang.at(3).isUpper() && lang.at(4).isUpper())))
        lang = "auto", cfgupdt = true;

    if(cfgupdt) cfgwrite();
}

uchar lu::exec(cQStr &cmd, uchar flag)
{
    auto exit([&cmd](uchar rv) -> uchar {
            if(rv) error("\n " % tr("An error occurred while executing the following command:") % "\n\n  " % cmd % "\n\n " % tr("Exit code:") % ' ' % QStr::number(rv) % "\n\n", true);
            return rv;
        });

    QSL args(cmd.split(' ', QString::SkipEmptyParts));
    if(args.isEmpty()) return exit(255);
    QStr prog(args.takeFirst());
    QProcess proc;

    if(flag & Silent)
        proc.setStandardOutputFile(QProcess::nullDevice()), proc.setStandardErrorFile(QProcess::nullDevice());
    else
        proc.setProcessChannelMode(QProcess::ForwardedChannels);

    proc.start(prog, args, QIODevice::ReadOnly);
    while(proc.state() == QProcess::Starting) msleep(10), qApp->processEvents();
    if(proc.error() == QProcess::FailedToStart) return exit(255);
    while(proc.state() == QProcess::Running) msleep(10), qApp->processEvents();
    return exit(proc.exitStatus() == QProcess::CrashExit ? 255 : proc.exitCode());
}

bool lu::mcheck(cQStr &item, cQStr &mnts)
{
    QStr itm(item.contains(' ') ? QStr(item).replace(" ", "\\040") : item);

    if(! itm.startsWith("/dev/"))
        return mnts.contains(' ' % itm % ' ');
    else if(QStr('\n' % mnts).contains('\n' % itm % (itm.length() > (itm.contains("mmc") ? 12 : 8) ? " " : nullptr)))
        return true;
    else
    {
        blkid_probe pr(blkid_new_probe_from_filename(bstr(itm)));
        if(! pr) return false;
        cchar *val(nullptr);
        blkid_do_probe(pr), blkid_probe_lookup_value(pr, "UUID", &val, nullptr);
        QStr uuid(val);
        blkid_free_probe(pr);
        return ! uuid.isEmpty() && QStr('\n' % mnts).contains("\n/dev/disk/by-uuid/" % uuid % ' ');
    }
}

ullong lu::devsize(cQStr &dev)
{
    ullong bsize;
    int odev;
    bool err;

    if(! (err = (odev = open(bstr(dev), O_RDONLY)) == -1))
    {
        if(ioctl(odev, BLKGETSIZE64, &bsize) == -1) err = true;
        close(odev);
    }

    return err ? 0 : bsize;
}

bool lu::mkpart(cQStr &dev, ullong start, ullong len)
{
    auto err([&dev] { return error("\n " % tr("An error occurred while creating a new partition on the following device:") % "\n\n  " % dev % fdbg(dev), true); });
    if(dev.length() > (dev.contains("mmc") ? 12 : 8) || stype(dev) != Isblock) return err();
    thrdelay(),
    ThrdType = Mkpart,
    ThrdStr[0] = dev,
    ThrdLng[0] = start,
    ThrdLng[1] = len,
    LUThrd.start(), thrdelay();
    return ThrdRslt ? true : err();
}

bool lu::mkptable(cQStr &dev, cQStr &type)
{
    auto err([&dev] { return error("\n " % tr("An error occurred while creating the partition table on the following device:") % "\n\n  " % dev % fdbg(dev), true); });
    if(dev.length() > (dev.contains("mmc") ? 12 : 8) || stype(dev) != Isblock) return err();
    thrdelay(),
    ThrdType = Mkptable,
    ThrdStr[0] = dev,
    ThrdStr[1] = type,
    LUThrd.start(), thrdelay();
    return ThrdRslt ? true : err();
}

bool lu::umount(cQStr &dev)
{
    thrdelay(),
    ThrdType = Umount,
    ThrdStr[0] = dev,
    LUThrd.start(), thrdelay();
    return ThrdRslt ? true : error("\n " % tr("An error occurred while unmounting the following partition/mount point:") % "\n\n  " % dev % fdbg(dev), true);
}

bool lu::umntall(cQStr &dev)
{
    bool ismmc(dev.contains("mmc"));
    QStr mnts(fload("/proc/self/mounts"));
    QTS in(&mnts, QIODevice::ReadOnly);

    while(! in.atEnd())
    {
        QStr cline(in.readLine()), mdev(left(cline, instr(cline, " ") - 1));

        if((mdev == dev || (mdev.startsWith(dev) && isnum(right(mdev, -(dev.length() + (ismmc ? 1 : 0)))))) && ! umnt(mdev))
            return error("\n " % tr("An error occurred while unmounting the following partition/mount point:") % "\n\n  " % mdev % fdbg(mdev), true);
    }

    return true;
}

void lu::readlvdevs(QSL &strlst)
{
    thrdelay(),
    ThrdType = Readlvdevs,
    ThrdSlst = &strlst,
    LUThrd.start(), thrdelay();
}

void lu::fssync()
{
    thrdelay(),
    ThrdType = Sync,
    LUThrd.start(), thrdelay();
}

bool lu::restore(cQStr &dev)
{
    bool ismmc(dev.contains("mmc"));
    if(stype(dev, true) != Isblock) return error("\n " % tr("The following device does not exist:") % "\n\n  " % dev % "\n\n");

    if(mcheck(dev))
    {
        for(cQStr &sitem : QDir("/dev").entryList(QDir::System))
        {
            QStr item("/dev/" % sitem);

            if(item.length() > (ismmc ? 12 : 8) && item.startsWith(dev))
                while(mcheck(item))
                    if(! umount(item)) return false;
        }

        if(mcheck(dev) && ! umount(dev)) return false;
    }

    fssync();
    if(! mkptable(dev)) return false;
    delay(100);
    if(! mkpart(dev)) return false;
    delay(100);
    if(exec("mkfs.vfat -F 32 -n " % left(QStr(distro).remove(' ').toUpper(), 11) % ' ' % dev % (ismmc ? "p" : nullptr) % '1', Silent)) return false;
    fssync();
    log(Info, tr("The following drive has been restored:") % ' ' % dev);
    return true;
}

bool lu::ddimage(cQStr &img, cQStr &dev, const std::function<bool(double)> &prgrss, QStr &emsg)
{
    auto err([&emsg](cQStr &txt, cQStr &path) {
            emsg = txt % ' ' % path;
            return error("\n " % txt % "\n\n  " % path % fdbg(path), true);
        });

    if(stype(img, true) != Isfile) return err(tr("The image file does not exist:"), img);
    if(stype(dev, true) != Isblock) return err(tr("The target device does not exist:"), dev);
    ullong isize(fsize(img));
    if(! isize) return err(tr("The image file is empty:"), img);
    if(isize > devsize(dev)) return err(tr("The image does not fit on the target device:"), dev);
    if(! umntall(dev)) return err(tr("Unable to unmount the target device:"), dev);
    int ifd(open(bstr(img), O_RDONLY));
    if(ifd == -1) return err(tr("Unable to open the image file:"), img);
    int ofd(open(bstr(dev), O_WRONLY | O_EXCL));

    if(ofd == -1)
    {
        close(ifd);
        return err(tr("Unable to open the target device for writing:"), dev);
    }

    QBA buf(1048576, '\0');
    ullong done(0);
    bool rv(true);

    forever
    {
        ssize_t rlen(read(ifd, buf.data(), buf.size()));

        if(rlen == -1)
        {
            if(errno == EINTR) continue;
            rv = err(tr("An error occurred while reading the image file:"), img);
            break;
        }
        else if(! rlen)
            break;

        for(ssize_t wpos(0) ; wpos < rlen ;)
        {
            ssize_t wlen(write(ofd, buf.constData() + wpos, rlen - wpos));

            if(wlen == -1)
            {
                if(errno == EINTR) continue;
                rv = err(tr("An error occurred while writing the target device:"), dev);
                goto end;
            }

            wpos += wlen;
        }

        if(! prgrss(double(done += rlen) / isize))
        {
            emsg = tr("The writing has been cancelled.");
            rv = false;
            break;
        }
    }

end:
    if(rv && fsync(ofd)) rv = err(tr("An error occurred while flushing the target device:"), dev);
    close(ifd), close(ofd);
    return rv;
}

inline QStr lu::rlink(cQStr &path, ushort blen)
{
    QBA rpath(blen, '\0');
    ssize_t len(readlink(bstr(path), rpath.data(), blen));
    return len > 0 ? QStr::fromUtf8(rpath.constData(), len) : nullptr;
}

void lu::run()
{
    auto psalign([](ullong pstart, ushort ssize) -> ullong {
            if(pstart <= 1048576 / ssize) return 1048576 / ssize;
            ushort rem(pstart % (1048576 / ssize));
            return rem ? pstart + 1048576 / ssize - rem : pstart;
        });

    auto pealign([](ullong end, ushort ssize) -> ullong {
            ushort rem(end % (1048576 / ssize));
            return rem ? rem < (1048576 / ssize) - 1 ? end - rem - 1 : end : end - 1;
        });

    switch(ThrdType) {
    case Sync:
        return sync();
    case Umount:
        ThrdRslt = umnt(ThrdStr[0]);
        return;
    case Readlvdevs:
    {
        ThrdSlst->reserve(10);
        QBA fstab(QFile::exists("/etc/fstab") ? fload("/etc/fstab") : nullptr);
        QSL dlst[]{{"_usb-*", "_mmc-*"}, {"_/dev/sd*", "_/dev/mmcblk*"}};

        for(cQStr &item : QDir("/dev/disk/by-id").entryList(QDir::Files | QDir::System))
        {
            if(like(item, dlst[0]) && ! item.contains("-part") && islink("/dev/disk/by-id/" % item))
            {
                QStr path(rlink("/dev/disk/by-id/" % item, 14));

                if(! path.isEmpty() && like((path = "/dev" % right(path, -5)).length(), {8, 12}) && like(path, dlst[1]))
                {
                    ullong size(devsize(path));

                    if(size > 536870911)
                    {
                        if(! fstab.isEmpty())
                        {
                            QSL fchk('_' % path % '*');
                            PedDevice *dev(ped_device_get(bstr(path)));

                            if(dev)
                            {
                                PedDisk *dsk(ped_disk_new(dev));

                                if(dsk)
                                {
                                    PedPartition *prt(nullptr);

                                    while((prt = ped_disk_next_partition(dsk, prt)))
                                        if(prt->num > 0 && prt->type != PED_PARTITION_EXTENDED)
                                        {
                                            QStr ppath(path % (path.length() == 12 ? "p" : nullptr) % QStr::number(prt->num));

                                            if(stype(ppath) == Isblock)
                                            {
                                                blkid_probe pr(blkid_new_probe_from_filename(bstr(ppath)));

                                                if(pr)
                                                {
                                                    blkid_do_probe(pr);
                                                    cchar *uuid(nullptr);
                                                    if(! blkid_probe_lookup_value(pr, "UUID", &uuid, nullptr) && uuid) fchk.append("_UUID=" % QStr(uuid) % '*');
                                                    blkid_free_probe(pr);
                                                }
                                            }
                                        }

                                    ped_disk_destroy(dsk);
                                }

                                ped_device_destroy(dev);
                            }

                            QTS in(&fstab, QIODevice::ReadOnly);

                            while(! in.atEnd())
                                if(like(in.readLine().trimmed(), fchk)) goto next;
                        }

                        QStr ftype;

                        {
                            blkid_probe pr(blkid_new_probe_from_filename(bstr(path)));

                            if(pr)
                            {
                                cchar *type(nullptr);
                                blkid_probe_enable_partitions(pr, 0);
                                if(! blkid_do_safeprobe(pr) && ! blkid_probe_lookup_value(pr, "TYPE", &type, nullptr) && type) ftype = type;
                                blkid_free_probe(pr);
                            }
                        }

                        ThrdSlst->append(path % '\n' % mid(item, 5, rinstr(item, "_") - 5).replace('_', ' ') % '\n' % QStr::number(size) % '\n' % ftype);
                    }
                }
            }

        next:;
        }

        ThrdSlst->removeDuplicates();
        return ThrdSlst->sort();
    }
    case Mkptable:
    {
        PedDevice *dev(ped_device_get(bstr(ThrdStr[0])));
        ThrdRslt = false;
        if(! dev) return;
        PedDisk *dsk(ped_disk_new_fresh(dev, ped_disk_type_get(bstr(ThrdStr[1]))));

        if(dsk)
        {
            ThrdRslt = ped_disk_commit_to_dev(dsk);
            ped_disk_commit_to_os(dsk), ped_disk_destroy(dsk);
        }

        return ped_device_destroy(dev);
    }
    case Mkpart:
    {
        PedDevice *dev(ped_device_get(bstr(ThrdStr[0])));
        ThrdRslt = false;
        if(! dev) return;
        PedDisk *dsk(ped_disk_new(dev));

        if(dsk)
        {
            ullong start(ThrdLng[0] ? ThrdLng[0] / dev->sector_size : 0), end(ThrdLng[1] ? (ThrdLng[0] + ThrdLng[1]) / dev->sector_size - 1 : dev->length - 1);
            PedPartition *crtprt(ped_partition_new(dsk, PED_PARTITION_NORMAL, ped_file_system_type_get("fat32"), psalign(start, dev->sector_size), pealign(end, dev->sector_size)));

            if(crtprt)
            {
                if(ped_disk_add_partition(dsk, crtprt, ped_constraint_exact(&crtprt->geom)) && ped_partition_set_flag(crtprt, PED_PARTITION_LBA, 1) && ped_disk_commit_to_dev(dsk)) ThrdRslt = true;
                ped_disk_commit_to_os(dsk);
            }

            ped_disk_destroy(dsk);
        }

        return ped_device_destroy(dev);
    }
    }
}

bool lu::umnt(cbstr &dev)
{
    libmnt_context *ucxt(mnt_new_context());
    if(! ucxt) return false;
    mnt_context_set_target(ucxt, dev),
    mnt_context_enable_force(ucxt, true),
    mnt_context_enable_lazy(ucxt, true),
    mnt_context_enable_loopdel(ucxt, true);
    bool rv(! mnt_context_umount(ucxt));
    mnt_free_context(ucxt);
    return rv;
}
