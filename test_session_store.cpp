#undef NDEBUG
#include <cassert>
#include <iostream>

#include <QCoreApplication>
#include <QDir>
#include <QSettings>
#include <QTemporaryDir>

#include "core/session_store.h"

static const QString kBase = "http://127.0.0.1:8000/api/v1";

static Session make_session(const QString& token, const QString& login, bool remembered) {
    Session s;
    s.token = token;
    s.login = login;
    s.apiBaseUrl = kBase;
    s.remembered = remembered;
    return s;
}

static void test_remembered_round_trip(const QString& file) {
    {
        SessionStore store(file, "session_token", kBase);
        assert(!store.restore().has_value());
        store.begin(make_session("tok-1", "alice", true));
        assert(store.isActive());
        assert(store.current().login == "alice");
    }
    // next launch
    SessionStore store(file, "session_token", kBase);
    assert(!store.isActive());
    const auto restored = store.restore();
    assert(restored.has_value());
    assert(*restored == make_session("tok-1", "alice", true));

    QSettings s(file, QSettings::IniFormat);
    assert(s.value("session/session_token").toString() == "tok-1");
    assert(s.value("session/api_base_url").toString() == kBase);

    store.end();
    assert(!SessionStore(file, "session_token", kBase).restore().has_value());
    std::cout << "[OK] remembered session survives a restart\n";
}

static void test_not_remembered(const QString& file) {
    SessionStore store(file, "session_token", kBase);
    store.begin(make_session("tok-a", "bob", true));
    // a second login without "remember me" drops the earlier record
    store.begin(make_session("tok-b", "bob", false));
    assert(store.current().token == "tok-b");

    SessionStore next(file, "session_token", kBase);
    assert(!next.restore().has_value());
    assert(next.lastLogin() == "bob");
    std::cout << "[OK] session without remember me is not persisted\n";
}

static void test_other_server(const QString& file) {
    {
        SessionStore store(file, "session_token", kBase);
        store.begin(make_session("tok-x", "carol", true));
    }
    SessionStore elsewhere(file, "session_token", "http://other:8000/api/v1");
    assert(!elsewhere.restore().has_value());
    // the stale record is removed, not just ignored
    assert(!SessionStore(file, "session_token", kBase).restore().has_value());
    std::cout << "[OK] session for another server is discarded\n";
}

static void test_signals_and_single_session(const QString& file) {
    SessionStore store(file, "gme_sid", kBase);
    int started = 0;
    int ended = 0;
    QObject::connect(&store, &SessionStore::sessionStarted, [&](const Session&) { ++started; });
    QObject::connect(&store, &SessionStore::sessionEnded, [&]() { ++ended; });

    store.begin(make_session("t1", "dave", true));
    store.begin(make_session("t2", "erin", true));
    assert(started == 2);
    assert(ended == 1);
    assert(store.current().login == "erin");

    QSettings s(file, QSettings::IniFormat);
    assert(s.value("session/gme_sid").toString() == "t2");

    store.end();
    store.end();
    assert(ended == 2);
    assert(!store.isActive());
    std::cout << "[OK] one session at a time, transitions signalled\n";
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QTemporaryDir dir;
    assert(dir.isValid());

    test_remembered_round_trip(QDir(dir.path()).filePath("a/session.ini"));
    test_not_remembered(QDir(dir.path()).filePath("b/session.ini"));
    test_other_server(QDir(dir.path()).filePath("c/session.ini"));
    test_signals_and_single_session(QDir(dir.path()).filePath("d/session.ini"));
    std::cout << "All session store tests passed.\n";
    return 0;
}
