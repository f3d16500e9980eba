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

#include "liveusb-creator-cli.hpp"

void liveusbcli::main()
{
    auto help([] {
            return tr("Usage: liveusb-creator-cli [option]\n\n"
                " Options:\n\n"
                "  -l, --list                     list the available images\n\n"
                "  -d, --drives                   list the connected portable drives\n\n"
                "  -w, --write <image> <device>   write an image file to a portable drive\n\n"
                "  -r, --restore <device>         restore a portable drive to its factory settings\n\n"
                "  -v, --version                  output the LiveUSB Creator version number\n\n"
                "  -h, --help                     show this help");
        });

    uchar rv([&]() -> uchar {
            QSL args(qApp->arguments());
            if(args.count() == 1) return 1;

            if(lu::like(args.at(1), {"_-h_", "_--help_"}))
                lu::print("\n " % help() % "\n\n");
            else if(lu::like(args.at(1), {"_-v_", "_--version_"}))
                lu::print("\n " % lu::appver() % "\n\n");
            else if(lu::like(args.at(1), {"_-l_", "_--list_"}))
                return args.count() == 2 ? list() : 1;
            else if(lu::like(args.at(1), {"_-d_", "_--drives_"}))
                return args.count() == 2 ? drives() : 1;
            else if(lu::like(args.at(1), {"_-w_", "_--write_", "_-r_", "_--restore_"}))
            {
                bool iswrt(lu::like(args.at(1), {"_-w_", "_--write_"}));

                return args.count() != (iswrt ? 4 : 3) ? 1
                    : getuid() + getgid() ? 2
                    : ! lu::lock() ? 3
                    : iswrt ? write(args.at(2), args.at(3))
                    : restore(args.at(2));
            }
            else
                return 1;

            return 0;
        }());

    if(! lu::like(rv, {0, 255})) lu::error("\n " % [=]() -> QStr {
            auto dbg([this](cQStr &txt) -> QStr {
                    if(! lu::eout.isEmpty()) lu::crtfile("/tmp/liveusb-creator-cli_stderr", QStr((lu::dbglev == lu::Cextdbg ? lu::dbginf() : nullptr) % lu::eout).trimmed().replace("\n\n\n", "\n\n").replace("\n ", "\n") % '\n');
                    return emsg.isEmpty() ? txt : QStr(txt % "\n\n " % emsg);
                });

            switch(rv) {
            case 1:
                return help();
            case 2:
                return tr("Root privileges are required for writing and restoring drives!");
            case 3:
                return tr("An another LiveUSB Creator process is currently running, please wait until it finishes.");
            case 4:
                return dbg(tr("The writing of the image is aborted!"));
            case 5:
                return dbg(tr("The restoration of the drive is aborted!"));
            case 6:
                return dbg(tr("The list of images is not available!"));
            case 7:
                return tr("The specified device is not a connected portable drive!");
            default:
                return tr("The specified image file does not exist!");
            }
        }() % "\n\n");

    lu::unlock();
    qApp->exit(rv);
}

bool liveusbcli::isdrive(cQStr &dev)
{
    QSL dlst;
    lu::readlvdevs(dlst);

    for(cQStr &item : dlst)
        if(item.startsWith(dev % '\n')) return true;

    return false;
}

uchar liveusbcli::list()
{
    catalogue::load();

    if(lu::updrel == lu::True)
    {
        QList<rinfo> rlst;
        if(catalogue::fetch(lu::burl, rlst, emsg)) catalogue::store(rlst);
    }

    if(catalogue::releases.isEmpty()) return 6;
    QStr txt;

    for(const rinfo &ri : catalogue::releases)
    {
        if(ri.source.isEmpty())
        {
            txt.append("\n " % ri.name % "\n\n");
            continue;
        }

        txt.append("  " % ri.name % (ri.version.isEmpty() ? nullptr : QStr(' ' % ri.version)) % "\n    " % ri.summary % '\n');

        for(QMap<QStr, rvariant>::const_iterator it(ri.variants.constBegin()) ; it != ri.variants.constEnd() ; ++it)
            txt.append("    " % it.key() % ": " % it.value().url % (it.value().size ? QStr(" (" % lu::hunit(it.value().size) % ')') : nullptr) % '\n');

        txt.append('\n');
    }

    lu::print("\n " % tr("Available images:") % "\n\n" % txt);
    return 0;
}

uchar liveusbcli::drives()
{
    QSL dlst;
    lu::readlvdevs(dlst);

    if(dlst.isEmpty())
        lu::print("\n " % tr("There are no portable devices connected.") % "\n\n");
    else
    {
        QStr txt;

        for(cQStr &item : dlst)
        {
            QSL vals(item.split('\n'));
            if(vals.count() > 2) txt.append("  " % vals.at(0) % "  " % vals.at(1) % " (" % lu::dunit(vals.at(2).toULongLong()) % ')' % (vals.value(3) == "iso9660" ? QStr("  [" % tr("live system") % ']') : nullptr) % '\n');
        }

        lu::print("\n " % tr("Connected portable drives:") % "\n\n" % txt % '\n');
    }

    return 0;
}

uchar liveusbcli::write(cQStr &img, cQStr &dev)
{
    if(! lu::isfile(img)) return 8;
    if(! isdrive(dev)) return 7;
    if(lu::dbglev == lu::Nulldbg) lu::dbglev = lu::Errdbg;
    creator lv;
    wrthread thrd(&lv);
    bool ok(false);
    thrd.img = img, thrd.dev = dev;

    connect(&thrd, &wrthread::wprogress, this, &liveusbcli::progress),
    connect(&thrd, &wrthread::wdone, this, [&](bool rslt, const QString &txt) {
            ok = rslt, emsg = txt;
        });

    lu::print("\n " % tr("Writing %1 to %2").arg(img, dev) % "\n\n"), progress(0);
    thrd.start();
    while(! thrd.wait(100)) qApp->processEvents();
    qApp->processEvents();
    QTS(stdout) << '\n';
    if(! ok) return 4;
    lu::print("\n " % tr("The image has been written.") % "\n\n");
    return 0;
}

uchar liveusbcli::restore(cQStr &dev)
{
    if(! isdrive(dev)) return 7;
    if(lu::dbglev == lu::Nulldbg) lu::dbglev = lu::Errdbg;
    lu::print("\n " % tr("Restoring %1").arg(dev) % "\n\n");
    if(! lu::restore(dev)) return 5;
    lu::print("\n " % tr("The drive has been restored.") % "\n\n");
    return 0;
}

void liveusbcli::progress(double value)
{
    short perc(qRound(value * 100));
    if(perc == cperc) return;
    cperc = perc;
    QTS(stdout) << "\r " << tr("Progress:") << ' ' << perc << "% ";
}
