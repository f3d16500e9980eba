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

#include "../liveusb/libliveusb/lulib.hpp"
#include "fakecreator.hpp"
#include <QDir>
#include <gtest/gtest.h>

TEST(lulib, hunitUsesBinaryUnits)
{
    EXPECT_EQ(lu::hunit(512), "512 B");
    EXPECT_EQ(lu::hunit(1536), "1.5 KiB");
    EXPECT_EQ(lu::hunit(1073741824), "1 GiB");
}

TEST(lulib, dunitUsesDecimalUnitsWithOneDigit)
{
    EXPECT_EQ(lu::dunit(999), "999.0 B");
    EXPECT_EQ(lu::dunit(1500), "1.5 KB");
    EXPECT_EQ(lu::dunit(8004304896ULL), "8.0 GB");
    EXPECT_EQ(lu::dunit(16008609792ULL), "16.0 GB");
    EXPECT_EQ(lu::dunit(2000000000000ULL), "2.0 TB");
}

TEST(lulib, stringHelpers)
{
    EXPECT_EQ(lu::left("/dev/sdb1", 8), "/dev/sdb");
    EXPECT_EQ(lu::left("/dev/sdb1", -1), "/dev/sdb");
    EXPECT_EQ(lu::right("../../sdb", -5), "/sdb");
    EXPECT_EQ(lu::mid("usb-SanDisk_Cruzer_123-0:0", 5, 14), "SanDisk_Cruzer");
    EXPECT_EQ(lu::instr("key=value", "="), 4);
    EXPECT_EQ(lu::rinstr("/a/b/c", "/"), 5);
    EXPECT_TRUE(lu::isnum("1234"));
    EXPECT_FALSE(lu::isnum("12a"));
    EXPECT_FALSE(lu::isnum(""));
}

TEST(lulib, likeMatchesPatterns)
{
    EXPECT_TRUE(lu::like("usb-SanDisk_Cruzer", {"_usb-*", "_mmc-*"}));
    EXPECT_TRUE(lu::like("mmc-SD16G_0x1234", {"_usb-*", "_mmc-*"}));
    EXPECT_FALSE(lu::like("ata-Samsung_SSD", {"_usb-*", "_mmc-*"}));
    EXPECT_TRUE(lu::like("usb-SanDisk_Cruzer", {"*Disk*"}));
    EXPECT_TRUE(lu::like("/dev/sdb", {"*sdb_"}));
    EXPECT_TRUE(lu::like("-h", {"_-h_", "_--help_"}));
    EXPECT_FALSE(lu::like("-hx", {"_-h_", "_--help_"}));
    EXPECT_TRUE(lu::like(12, {8, 12}));
    EXPECT_FALSE(lu::like(9, {8, 12}));
}

TEST(lulib, fmtSubstitutesDistribution)
{
    EXPECT_EQ(lu::fmt("{DISTRO} LiveUSB Creator for {DISTRO}"), "Fedora LiveUSB Creator for Fedora");
}

TEST(lulib, cfgreadFixesInvalidValues)
{
    lu::crtfile(lu::cfgpath, "distro=\nbase_url=ftp://mirror.example.org/releases.json\nupdate_releases=maybe\nlanguage=english\n");
    lu::cfgread();
    EXPECT_EQ(lu::distro, "Fedora");
    EXPECT_EQ(lu::burl, "https://getfedora.org/releases.json");
    EXPECT_EQ(lu::mcats, QSL{"Fedora"});
    EXPECT_EQ(lu::updrel, lu::True);
    EXPECT_EQ(lu::lang, "auto");
    EXPECT_EQ(lu::rcache, "/var/cache/liveusb-creator/releases.json");
    EXPECT_FALSE(lu::dldir.isEmpty());

    QStr cfg(lu::fload(lu::cfgpath));
    EXPECT_TRUE(cfg.contains("\ndistro=Fedora\n"));
    EXPECT_TRUE(cfg.contains("\nupdate_releases=true\n"));
    EXPECT_TRUE(cfg.contains("\ndownload_directory=\n"));
    EXPECT_FALSE(cfg.contains(QDir::homePath() % "/Downloads"));
    testcfg();
}

TEST(lulib, cfgreadDefaultsCategoryToDistro)
{
    lu::crtfile(lu::cfgpath, "distro=Antergos\nupdate_releases=false\n");
    lu::cfgread();
    EXPECT_EQ(lu::mcats, QSL{"Antergos"});
    EXPECT_EQ(lu::dldir, QDir::homePath() % "/Downloads");
    QStr cfg(lu::fload(lu::cfgpath));
    EXPECT_TRUE(cfg.contains("\nmain_categories=Antergos\n"));
    EXPECT_TRUE(cfg.contains("\ndownload_directory=\n"));
    testcfg();
}

TEST(lulib, cfgreadKeepsValidValues)
{
    lu::crtfile(lu::cfgpath, "# comment\ndistro=Antergos\nbase_url=file:///srv/releases.json\nmain_categories=Antergos, Community,\ndownload_directory=" % testdir % "//dl/\nupdate_releases=false\nlanguage=hu_HU\n");
    lu::cfgread();
    EXPECT_EQ(lu::distro, "Antergos");
    EXPECT_EQ(lu::burl, "file:///srv/releases.json");
    EXPECT_EQ(lu::mcats, (QSL{"Antergos", "Community"}));
    EXPECT_EQ(lu::dldir, testdir % "/dl");
    EXPECT_EQ(lu::updrel, lu::False);
    EXPECT_EQ(lu::lang, "hu_HU");
    testcfg();
}

TEST(lulib, crtfileAndFload)
{
    QStr path(testdir % "/lulib.txt");
    ASSERT_TRUE(lu::crtfile(path, "first line\nsecond line\n"));
    EXPECT_TRUE(lu::isfile(path));
    EXPECT_EQ(lu::fload(path), QBA("first line\nsecond line\n"));
    EXPECT_EQ(lu::fsize(path), 23ULL);
    EXPECT_EQ(lu::stype(path), lu::Isfile);
    EXPECT_TRUE(QFile::remove(path));
    EXPECT_EQ(lu::stype(path), lu::Notexist);
    EXPECT_FALSE(lu::crtfile(testdir % "/missing/lulib.txt", "text"));
}

TEST(lulib, mcheckSearchesMountTable)
{
    QStr mnts("/dev/sdb1 /run/media/user/LIVE vfat rw 0 0\n/dev/sda2 / ext4 rw 0 0\n");
    EXPECT_TRUE(lu::mcheck("/run/media/user/LIVE", mnts));
    EXPECT_TRUE(lu::mcheck("/dev/sdb1", mnts));
    EXPECT_TRUE(lu::mcheck("/dev/sdb", mnts));
    EXPECT_FALSE(lu::mcheck("/run/media/user", mnts));
    EXPECT_FALSE(lu::mcheck("/dev/sdz9", mnts));
}

TEST(lulib, execReturnsExitCode)
{
    EXPECT_EQ(lu::exec("true"), 0);
    EXPECT_EQ(lu::exec("false", lu::Silent), 1);
    EXPECT_EQ(lu::exec("liveusb-no-such-command"), 255);
}

TEST(lulib, execReportsEveryFailedCommand)
{
    uchar dlev(lu::dbglev);
    lu::dbglev = lu::Errdbg, lu::eout.clear();
    EXPECT_EQ(lu::exec("true", lu::Silent), 0);
    EXPECT_TRUE(lu::eout.isEmpty());
    EXPECT_EQ(lu::exec("false", lu::Silent), 1);
    EXPECT_TRUE(lu::eout.contains("false"));
    EXPECT_TRUE(lu::eout.contains("Exit code: 1"));
    lu::dbglev = dlev, lu::eout.clear();
}

TEST(lulib, ddimageRejectsInvalidTargets)
{
    QStr emsg, img(testdir % "/image.iso");
    auto prgrss([](double) { return true; });
    EXPECT_FALSE(lu::ddimage(testdir % "/missing.iso", "/dev/null", prgrss, emsg));
    EXPECT_TRUE(emsg.contains("missing.iso"));
    ASSERT_TRUE(lu::crtfile(img, "not really an image"));
    emsg.clear();
    EXPECT_FALSE(lu::ddimage(img, testdir % "/notadevice", prgrss, emsg));
    EXPECT_TRUE(emsg.contains("notadevice"));
    EXPECT_TRUE(QFile::remove(img));
}

TEST(lulib, restoreRejectsMissingDevice)
{
    EXPECT_FALSE(lu::restore(testdir % "/sdx"));
}
