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

#include "../liveusb/libliveusb/catalogue.hpp"
#include "fakecreator.hpp"
#include <QUrl>
#include <gtest/gtest.h>

TEST(catalogue, parseReadsReleaseRecords)
{
    QList<rinfo> rlst(catalogue::parse(samplejson()));
    ASSERT_EQ(rlst.count(), 4);
    const rinfo &ws(rlst.at(0));
    EXPECT_EQ(ws.name, "Fedora Workstation");
    EXPECT_EQ(ws.version, "24");
    EXPECT_EQ(ws.releaseDate, "2016-06-21");
    EXPECT_EQ(ws.source, "Fedora");
    EXPECT_EQ(ws.screenshots, QSL{"qrc:/shot1"});
    ASSERT_EQ(ws.variants.count(), 2);
    EXPECT_EQ(ws.variants.value("x86_64").size, 1503238553ULL);
    EXPECT_EQ(ws.variants.value("i386").size, ullong(qRound64(1.3 * 1024 * 1024 * 1024)));
    EXPECT_EQ(ws.variants.value("x86_64").url, "https://download.example.org/Fedora-Workstation-24-x86_64.iso");
    EXPECT_TRUE(rlst.at(1).source.isEmpty());
    EXPECT_TRUE(rlst.at(1).variants.isEmpty());
    EXPECT_TRUE(rlst.at(1).description.isEmpty());
    EXPECT_EQ(rlst.at(2).variants.value("i686").filename, "Fedora-KDE-24-i686.iso");
}

TEST(catalogue, parseRejectsInvalidDocuments)
{
    EXPECT_TRUE(catalogue::parse("not json").isEmpty());
    EXPECT_TRUE(catalogue::parse("{\"name\": \"Fedora\"}").isEmpty());
    QList<rinfo> rlst(catalogue::parse("[1, \"text\", {\"name\": \"Only\"}]"));
    ASSERT_EQ(rlst.count(), 1);
    EXPECT_EQ(rlst.at(0).name, "Only");
}

TEST(catalogue, flavorsAppendsLocalEntry)
{
    QList<rinfo> flst(catalogue::flavors(catalogue::parse(samplejson())));
    ASSERT_EQ(flst.count(), 5);
    EXPECT_EQ(flst.last().name, "Custom OS...");
    EXPECT_EQ(flst.last().summary, "Pick a file from your drive(s)");
    EXPECT_TRUE(flst.last().description.contains("choose a OS image from your hard drive"));
    EXPECT_EQ(flst.last().source, "Local");
    EXPECT_EQ(flst.last().logo, "qrc:/icon_folder");
    EXPECT_EQ(catalogue::flavors(QList<rinfo>()).count(), 1);
}

TEST(catalogue, sizetxtParsesHumanSizes)
{
    EXPECT_EQ(catalogue::sizetxt("1.9 GB"), ullong(qRound64(1.9 * 1073741824.0)));
    EXPECT_EQ(catalogue::sizetxt("700M"), 734003200ULL);
    EXPECT_EQ(catalogue::sizetxt("512 KB"), 524288ULL);
    EXPECT_EQ(catalogue::sizetxt("1,5 GiB"), 1610612736ULL);
    EXPECT_EQ(catalogue::sizetxt("2 tb"), 2199023255552ULL);
    EXPECT_EQ(catalogue::sizetxt("123"), 123ULL);
    EXPECT_EQ(catalogue::sizetxt("Size: 1.9 GB"), ullong(qRound64(1.9 * 1073741824.0)));
    EXPECT_EQ(catalogue::sizetxt("Fedora 24 Mate 1.9 GB"), ullong(qRound64(1.9 * 1073741824.0)));
    EXPECT_EQ(catalogue::sizetxt("2 images"), 0ULL);
    EXPECT_EQ(catalogue::sizetxt("large"), 0ULL);
    EXPECT_EQ(catalogue::sizetxt(""), 0ULL);
}

TEST(catalogue, storeWritesTheCache)
{
    EXPECT_FALSE(catalogue::store(QList<rinfo>()));
    ASSERT_TRUE(catalogue::store(catalogue::parse(samplejson())));
    EXPECT_TRUE(lu::isfile(lu::rcache));
    catalogue::releases.clear();
    catalogue::load();
    ASSERT_EQ(catalogue::releases.count(), 4);
    EXPECT_EQ(catalogue::releases.at(3).name, "Design Suite");
    EXPECT_EQ(catalogue::releases.at(3).variants.value("x86_64").size, 2147483648ULL);
}

TEST(catalogue, serializeSkipsLocalEntry)
{
    QList<rinfo> rlst(catalogue::parse(catalogue::serialize(catalogue::flavors(catalogue::parse(samplejson())))));
    ASSERT_EQ(rlst.count(), 4);
    for(const rinfo &ri : rlst) EXPECT_NE(ri.source, "Local");
}

TEST(catalogue, fetchReadsLocalUrl)
{
    QStr path(testdir % "/releases.json"), emsg;
    ASSERT_TRUE(lu::crtfile(path, QStr::fromUtf8(samplejson())));
    QList<rinfo> rlst;
    EXPECT_TRUE(catalogue::fetch(QUrl::fromLocalFile(path).toString(), rlst, emsg));
    EXPECT_EQ(rlst.count(), 4);
    EXPECT_TRUE(emsg.isEmpty());
    EXPECT_FALSE(catalogue::fetch(QUrl::fromLocalFile(testdir % "/missing.json").toString(), rlst, emsg));
    EXPECT_FALSE(emsg.isEmpty());
    EXPECT_EQ(rlst.count(), 4);
}

TEST(catalogue, updthreadFetchesInBackground)
{
    QStr path(testdir % "/update.json");
    ASSERT_TRUE(lu::crtfile(path, QStr::fromUtf8(samplejson())));
    updthread uthrd;
    uthrd.url = QUrl::fromLocalFile(path).toString();
    uthrd.start();
    ASSERT_TRUE(uthrd.wait(10000));
    EXPECT_TRUE(uthrd.ok);
    EXPECT_EQ(uthrd.rlst.count(), 4);
    uthrd.url = QUrl::fromLocalFile(testdir % "/missing.json").toString();
    uthrd.start();
    ASSERT_TRUE(uthrd.wait(10000));
    EXPECT_FALSE(uthrd.ok);
    EXPECT_TRUE(uthrd.rlst.isEmpty());
}
