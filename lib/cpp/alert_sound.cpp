/////////////////////////////////////////////////////////////////////////////
// Plays the warning sound in a child process while an alert is active.
//
/////////////////////////////////////////////////////////////////////////////

#include <system_error>

#include <boost/algorithm/string.hpp>
#include <boost/process.hpp>

#include "app.h"
#include "alert_sound.h"

using namespace std;

namespace bp = boost::process;


// player_cmd is the player executable and its flags, ex: "mpg123 -q". The
// sound path is appended as the last argument.
AlertPlayer::AlertPlayer(const string &player_cmd, const string &sound_path) {
    m_disabled = false;
    m_times_started = 0;

    vector<string> tokens;
    string cmd = boost::algorithm::trim_copy(player_cmd);
    boost::algorithm::split(tokens, cmd, boost::is_any_of(" \t"),
                            boost::token_compress_on);

    if (tokens.empty() || tokens[0].empty()) {
        warn("No ALERT_PLAYER_CMD set, audio alerts disabled.");
        m_disabled = true;
        return;
    }

    m_exe = tokens[0];
    m_args.assign(tokens.begin() + 1, tokens.end());
    m_args.push_back(sound_path);
}

AlertPlayer::~AlertPlayer() {
    stop();
}

// Starts the sound when the alert is active and nothing is playing (a sound
// that finished is started again), stops it when the alert clears.
void AlertPlayer::update(bool alert) {
    if (alert) {
        if (!m_disabled && !is_playing())
            play();
    } else {
        stop();
    }
}

bool AlertPlayer::is_playing() {
    if (!m_player)
        return false;

    error_code ec;
    bool running = m_player->running(ec);
    if (ec || !running) {
        m_player->wait(ec);
        m_player.reset();
        return false;
    }

    return true;
}

void AlertPlayer::stop() {
    if (!m_player)
        return;

    error_code ec;
    if (m_player->running(ec))
        m_player->terminate(ec);
    if (!ec)
        m_player->wait(ec);
    if (ec)
        warn("Alert player didn't stop cleanly: " + ec.message());

    m_player.reset();
}

void AlertPlayer::play() {
    boost::filesystem::path exe = m_exe;
    if (m_exe.find('/') == string::npos)
        exe = bp::search_path(m_exe);

    if (exe.empty()) {
        warn("Alert player " + m_exe + " not found, audio alerts disabled.");
        m_disabled = true;
        return;
    }

    try {
        m_player.reset(new bp::child(exe, bp::args(m_args),
                                     bp::std_out > bp::null,
                                     bp::std_err > bp::null));
        m_times_started++;
    } catch (const bp::process_error &e) {
        warn(string("Alert player failed to start, audio alerts disabled: ") + e.what());
        m_disabled = true;
    }
}
