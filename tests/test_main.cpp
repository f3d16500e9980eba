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

#include "fakecreator.hpp"
#include <QTemporaryDir>
#include <gtest/gtest.h>

QStr testdir;

void testcfg(cQStr &extra)
{
    lu::crtfile(lu::cfgpath, "distro=Fedora\n"
        "base_url=https://getfedora.org/releases.json\n"
        "main_categories=Fedora\n"
        "download_directory=" % testdir % "/dl\n"
        "release_cache=" % testdir % "/cache/releases.json\n"
        "update_releases=false\n"
        "language=en_EN\n" % extra);

    lu::cfgread();
}

QBA samplejson()
{
    return "[\n"
        " {\"name\": \"Fedora Workstation\", \"summary\": \"Fedora for desktops and laptops\", \"description\": \"<p>Workstation</p>\", \"version\": \"24\","
        "  \"releaseDate\": \"2016-06-21\", \"logo\": \"qrc:/logo-fedora\", \"source\": \"Fedora\", \"screenshots\": [\"qrc:/shot1\"],"
        "  \"variants\": {\"x86_64\": {\"url\": \"https://download.example.org/Fedora-Workstation-24-x86_64.iso\", \"sha256\": \"\", \"size\": 1503238553, \"filename\": \"\"},"
        "               \"i386\": {\"url\": \"https://download.example.org/Fedora-Workstation-24-i386.iso\", \"sha256\": \"\", \"size\": \"1.3 GB\", \"filename\": \"\"}}},\n"
        " {\"name\": \"Spins\", \"summary\": \"\", \"source\": \"\"},\n"
        " {\"name\": \"KDE Plasma Desktop\", \"summary\": \"A complete, modern desktop\", \"version\": \"24\", \"source\": \"Spins\","
        "  \"variants\": {\"i686\": {\"url\": \"https://download.example.org/kde\", \"size\": 1363148800, \"filename\": \"Fedora-KDE-24-i686.iso\"}}},\n"
        " {\"name\": \"Design Suite\", \"summary\": \"Visual design and multimedia\", \"version\": \"24\", \"source\": \"Labs\","
        "  \"variants\": {\"x86_64\": {\"url\": \"https://download.example.org/design\", \"size\": 2147483648, \"filename\": \"Fedora-Design-24-x86_64.iso\"}}}\n"
        "]\n";
}

bool waitfor(const std::function<bool()> &cond, int msec)
{
    QElapsedTimer time;
    time.start();

    while(! cond())
    {
        if(time.elapsed() > msec) return false;
        QCoreApplication::processEvents(), QThread::msleep(5);
    }

    return true;
}

int main(int argc, char *argv[])
{
    QCoreApplication a(argc, argv);
    QTemporaryDir tdir;
    if(! tdir.isValid()) return 1;
    testdir = tdir.path();
    lu::cfgpath = testdir % "/liveusb-creator.conf";
    testcfg();
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
