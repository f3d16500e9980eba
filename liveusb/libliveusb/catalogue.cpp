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

#include "catalogue.hpp"
#include <QRegularExpression>
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QNetworkReply>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include <QEventLoop>
#include <QDir>
#include <QUrl>

QList<rinfo> catalogue::releases;

rinfo catalogue::local()
{
    rinfo ri;
    ri.name = tr("Custom OS..."),
    ri.summary = tr("Pick a file from your drive(s)"),
    ri.description = tr("<p>Here you can choose a OS image from your hard drive to be written to your flash disk</p><p>Currently it is only supported to write raw disk images (.iso or .bin)</p>"),
    ri.logo = "qrc:/icon_folder",
    ri.source = "Local",
    ri.variants.insert(QStr(), rvariant());
    return ri;
}

QList<rinfo> catalogue::flavors(const QList<rinfo> &rlst)
{
    QList<rinfo> flst(rlst);
    flst.append(local());
    return flst;
}

ullong catalogue::sizetxt(cQStr &txt)
{
    QRegularExpressionMatch match(QRegularExpression("([0-9]+(?:[.,][0-9]+)?)\\s?([KMGT])(?:i?B)?\\b", QRegularExpression::CaseInsensitiveOption).match(txt));
    if(! (match.hasMatch() || (match = QRegularExpression("^\\s*([0-9]+)\\s*B?\\s*$", QRegularExpression::CaseInsensitiveOption).match(txt)).hasMatch())) return 0;
    double size(QStr(match.captured(1)).replace(',', '.').toDouble());

    switch(match.captured(2).toUpper().isEmpty() ? 0 : match.captured(2).toUpper().at(0).toLatin1()) {
    case 'T':
        size *= 1024.0;
    case 'G':
        size *= 1024.0;
    case 'M':
        size *= 1024.0;
    case 'K':
        size *= 1024.0;
    }

    return qRound64(size);
}

QList<rinfo> catalogue::parse(cQBA &json)
{
    QList<rinfo> rlst;
    QJsonParseError perr;
    QJsonDocument doc(QJsonDocument::fromJson(json, &perr));

    if(perr.error != QJsonParseError::NoError || ! doc.isArray())
    {
        lu::error("\n " % tr("The release list could not be parsed:") % ' ' % (perr.error == QJsonParseError::NoError ? tr("not a JSON array") : perr.errorString()) % "\n\n", true);
        return rlst;
    }

    for(const QJsonValue &val : doc.array())
        if(val.isObject())
        {
            QJsonObject obj(val.toObject());
            rinfo ri;
            ri.name = obj.value("name").toString(),
            ri.summary = obj.value("summary").toString(),
            ri.description = obj.value("description").toString(),
            ri.version = obj.value("version").toString(),
            ri.releaseDate = obj.value("releaseDate").toString(),
            ri.logo = obj.value("logo").toString(),
            ri.source = obj.value("source").toString();
            for(const QJsonValue &shot : obj.value("screenshots").toArray()) ri.screenshots.append(shot.toString());
            QJsonObject vrnts(obj.value("variants").toObject());

            for(QJsonObject::const_iterator it(vrnts.constBegin()) ; it != vrnts.constEnd() ; ++it)
            {
                QJsonObject vobj(it.value().toObject());
                QJsonValue vsize(vobj.value("size"));
                ri.variants.insert(it.key(), {vobj.value("url").toString(), vobj.value("sha256").toString(), vobj.value("filename").toString(), vsize.isDouble() ? ullong(vsize.toDouble()) : sizetxt(vsize.toString())});
            }

            rlst.append(ri);
        }

    return rlst;
}

QBA catalogue::serialize(const QList<rinfo> &rlst)
{
    QJsonArray arr;

    for(const rinfo &ri : rlst)
    {
        if(ri.source == "Local") continue;
        QJsonObject obj, vrnts;

        for(QMap<QStr, rvariant>::const_iterator it(ri.variants.constBegin()) ; it != ri.variants.constEnd() ; ++it)
        {
            QJsonObject vobj;
            vobj.insert("url", it.value().url),
            vobj.insert("sha256", it.value().sha256),
            vobj.insert("filename", it.value().filename),
            vobj.insert("size", double(it.value().size)),
            vrnts.insert(it.key(), vobj);
        }

        obj.insert("name", ri.name),
        obj.insert("summary", ri.summary),
        obj.insert("description", ri.description),
        obj.insert("version", ri.version),
        obj.insert("releaseDate", ri.releaseDate),
        obj.insert("logo", ri.logo),
        obj.insert("source", ri.source),
        obj.insert("screenshots", QJsonArray::fromStringList(ri.screenshots)),
        obj.insert("variants", vrnts),
        arr.append(obj);
    }

    return QJsonDocument(arr).toJson();
}

bool catalogue::fetch(cQStr &url, QList<rinfo> &rlst, QStr &emsg)
{
    QNetworkAccessManager nam;
    QNetworkRequest rqst((QUrl(url)));
#if QT_VERSION >= QT_VERSION_CHECK(5, 6, 0)
    rqst.setAttribute(QNetworkRequest::FollowRedirectsAttribute, true);
#endif
    QNetworkReply *rply(nam.get(rqst));

    if(! rply->isFinished())
    {
        QEventLoop loop;
        QObject::connect(rply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
        loop.exec();
    }

    if(rply->error() != QNetworkReply::NoError)
    {
        emsg = tr("Unable to download the release list:") % ' ' % rply->errorString();
        delete rply;
        return false;
    }

    QList<rinfo> nlst(parse(rply->readAll()));
    delete rply;

    if(nlst.isEmpty())
    {
        emsg = tr("The release list is empty or invalid:") % ' ' % url;
        return false;
    }

    rlst = nlst;
    return true;
}

bool catalogue::store(const QList<rinfo> &rlst)
{
    if(rlst.isEmpty()) return false;
    releases = rlst;
    QStr cdir(lu::left(lu::rcache, lu::rinstr(lu::rcache, "/") - 1));
    if(! lu::isdir(cdir) && ! QDir().mkpath(cdir)) return lu::error("\n " % tr("An error occurred while creating the following directory:") % "\n\n  " % cdir % "\n\n", true);
    return lu::crtfile(lu::rcache, QStr::fromUtf8(serialize(rlst)));
}

void catalogue::load()
{
    releases = lu::isfile(lu::rcache) ? parse(lu::fload(lu::rcache)) : QList<rinfo>();
}

updthread::updthread(QObject *prnt) : QThread(prnt), ok(false) {}

void updthread::run()
{
    rlst.clear(), emsg.clear();
    if(! (ok = catalogue::fetch(url, rlst, emsg))) lu::log(lu::Warn, emsg);
}
