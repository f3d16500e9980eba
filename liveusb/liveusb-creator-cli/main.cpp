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

int main(int argc, char *argv[])
{
    switch(lu::dbglev) {
    case lu::Alldbg:
        lu::dbglev = lu::Nulldbg;
        break;
    case lu::Extdbg:
        lu::dbglev = lu::Cextdbg;
    }

    QCoreApplication a(argc, argv);
    lu::ldtltr();
    liveusbcli c;

    QTimer::singleShot(0, &c,
#if QT_VERSION < QT_VERSION_CHECK(5, 4, 0)
        SLOT(main())
#else
        &liveusbcli::main
#endif
        );

    uchar rv(a.exec());
    return rv;
}
