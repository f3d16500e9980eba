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

#include "../liveusb/libliveusb/lvdata.hpp"
#include "fakecreator.hpp"
#include <QUrl>
#include <gtest/gtest.h>

class lvdatatest : public ::testing::Test
{
protected:
    fakecreator lv;
    lvdata *lvd;
    QList<drvinfo> dlst;

    void SetUp()
    {
        catalogue::store(catalogue::parse(samplejson()));
        lvd = new lvdata(&lv);
        dlst = {{"/dev/sdb", "SanDisk Cruzer", 16008609792ULL, false}, {"/dev/sdc", "Kingston DT", 8004304896ULL, true}};
    }

    void TearDown()
    {
        delete lvd;
    }
};

TEST_F(lvdatatest, initialState)
{
    EXPECT_EQ(lvd->releases().count(), 5);
    EXPECT_EQ(lvd->releaseModel()->rowCount(), 5);
    EXPECT_EQ(lvd->currentIndex(), 0);
    EXPECT_EQ(lvd->currentImage(), lvd->releases().first());
    EXPECT_EQ(lvd->driveToRestore(), nullptr);
    EXPECT_TRUE(lvd->usbDriveNames().isEmpty());
    EXPECT_TRUE(lvd->usbDrives().isEmpty());
    EXPECT_TRUE(static_cast<bool>(lv.cb));
}

TEST_F(lvdatatest, currentIndexSelectsImage)
{
    int cnt(0);
    QObject::connect(lvd, &lvdata::currentImageChanged, [&cnt] { ++cnt; });
    lvd->setCurrentIndex(2);
    lvd->setCurrentIndex(2);
    EXPECT_EQ(cnt, 1);
    EXPECT_EQ(lvd->currentImage()->name(), "KDE Plasma Desktop");
    lvd->setCurrentIndex(10);
    EXPECT_EQ(lvd->currentImage(), nullptr);
}

TEST_F(lvdatatest, drivesAreListed)
{
    int dcnt(0), ccnt(0), rcnt(0);
    QObject::connect(lvd, &lvdata::usbDrivesChanged, [&dcnt] { ++dcnt; });
    QObject::connect(lvd, &lvdata::currentDriveChanged, [&ccnt] { ++ccnt; });
    QObject::connect(lvd, &lvdata::driveToRestoreChanged, [&rcnt] { ++rcnt; });
    lv.setdrives(dlst);
    EXPECT_EQ(lvd->usbDriveNames(), (QSL{"SanDisk Cruzer (16.0 GB)", "Kingston DT (8.0 GB)"}));
    EXPECT_EQ(lvd->usbDrives().count(), 2);
    EXPECT_EQ(lvd->currentDrive(), 0);
    EXPECT_EQ(lv.drive, "/dev/sdb");
    ASSERT_NE(lvd->driveToRestore(), nullptr);
    EXPECT_EQ(lvd->driveToRestore()->drive(), "/dev/sdc");
    EXPECT_EQ(dcnt, 1);
    EXPECT_EQ(ccnt, 1);
    EXPECT_EQ(rcnt, 1);
    lv.setdrives(dlst);
    EXPECT_EQ(dcnt, 1);
}

TEST_F(lvdatatest, selectedDriveSurvivesRescan)
{
    lv.setdrives(dlst);
    lvd->setCurrentDrive(1);
    EXPECT_EQ(lv.drive, "/dev/sdc");
    dlst.prepend({"/dev/sdd", "Transcend", 4000000000ULL, false});
    lv.setdrives(dlst);
    EXPECT_EQ(lvd->currentDrive(), 2);
    EXPECT_EQ(lv.drive, "/dev/sdc");
    dlst.removeLast();
    lv.setdrives(dlst);
    EXPECT_EQ(lvd->currentDrive(), 0);
    EXPECT_EQ(lv.drive, "/dev/sdd");
    EXPECT_EQ(lvd->driveToRestore(), nullptr);
    lv.setdrives({});
    EXPECT_EQ(lvd->currentDrive(), -1);
    EXPECT_TRUE(lv.drive.isEmpty());
}

TEST_F(lvdatatest, setCurrentDriveClampsAndResetsWriters)
{
    lvd->setCurrentDrive(1);
    EXPECT_EQ(lvd->currentDrive(), -1);
    lv.setdrives(dlst);
    rwriter *wr(lvd->releases().first()->writer());
    wr->setFinished(true);
    lvd->setCurrentDrive(1);
    EXPECT_EQ(lv.drive, "/dev/sdc");
    EXPECT_FALSE(wr->finished());
    wr->setFinished(true);
    lvd->setCurrentDrive(7);
    EXPECT_EQ(lvd->currentDrive(), 0);
    EXPECT_EQ(lv.drive, "/dev/sdb");
    EXPECT_FALSE(wr->finished());
}

TEST_F(lvdatatest, restoreHoldsDriveList)
{
    lv.setdrives(dlst);
    usbdrive *drv(lvd->driveToRestore());
    ASSERT_NE(drv, nullptr);
    drv->restore();
    EXPECT_TRUE(drv->beingRestored());
    EXPECT_EQ(lv.rdev, "/dev/sdc");
    lv.setdrives({dlst.first()});
    EXPECT_EQ(lvd->usbDriveNames().count(), 2);
    lv.rcb(true, nullptr);
    EXPECT_FALSE(drv->beingRestored());
    lv.setdrives({dlst.first()});
    EXPECT_EQ(lvd->usbDriveNames(), QSL{"SanDisk Cruzer (16.0 GB)"});
    EXPECT_EQ(lvd->driveToRestore(), nullptr);
}

TEST_F(lvdatatest, fillReleasesWaitsForWriters)
{
    QStr img(testdir % "/busy.iso");
    lu::crtfile(img, QStr(512, 'x'));
    lv.setdrives(dlst);
    lv.hold.store(1);
    release *lcl(lvd->releases().last());
    lcl->setPath(img);
    lcl->write();
    ASSERT_TRUE(waitfor([this] { return lv.ddcalls.load() == 1; }));
    lvd->fillReleases();
    EXPECT_EQ(lvd->releases().last(), lcl);
    lv.hold.store(0);
    ASSERT_TRUE(waitfor([lcl] { return ! lcl->writer()->running(); }));
    int cnt(0);
    QObject::connect(lvd, &lvdata::currentImageChanged, [&cnt] { ++cnt; });
    lvd->fillReleases();
    EXPECT_EQ(cnt, 1);
    EXPECT_EQ(lvd->releases().count(), 5);
    EXPECT_NE(lvd->releases().last(), lcl);
}

TEST_F(lvdatatest, configReflectsSettings)
{
    QVariantMap cfg(lvd->config());
    EXPECT_EQ(cfg.value("distro").toString(), "Fedora");
    EXPECT_EQ(cfg.value("base_url").toString(), "https://getfedora.org/releases.json");
    EXPECT_EQ(cfg.value("main_categories").toStringList(), QSL{"Fedora"});
    EXPECT_EQ(cfg.value("download_directory").toString(), testdir % "/dl");
    EXPECT_EQ(cfg.value("release_cache").toString(), testdir % "/cache/releases.json");
    EXPECT_FALSE(cfg.value("update_releases").toBool());
    EXPECT_EQ(cfg.value("language").toString(), "en_EN");
}

TEST(lvdata, updateThreadRefreshesReleases)
{
    QStr json(testdir % "/update.json");
    lu::crtfile(json, "[{\"name\": \"Fedora Server\", \"summary\": \"Run applications on bare metal\", \"source\": \"Fedora\","
        " \"variants\": {\"x86_64\": {\"url\": \"https://download.example.org/server.iso\", \"size\": 2048}}}]");
    catalogue::store(catalogue::parse(samplejson()));
    lu::updrel = lu::True, lu::burl = QUrl::fromLocalFile(json).toString();
    fakecreator lv;
    lvdata lvd(&lv);
    int cnt(0);
    QObject::connect(&lvd, &lvdata::updateThreadStopped, [&cnt] { ++cnt; });
    EXPECT_EQ(lvd.releases().count(), 5);
    ASSERT_TRUE(waitfor([&cnt] { return cnt == 1; }, 10000));
    ASSERT_EQ(lvd.releases().count(), 2);
    EXPECT_EQ(lvd.releases().first()->name(), "Fedora Server");
    catalogue::load();
    EXPECT_EQ(catalogue::releases.count(), 1);
    testcfg();
}
