/////////////////////////////////////////////////////////////////////////////
// Plays the warning sound in a child process while an alert is active.
//
/////////////////////////////////////////////////////////////////////////////

#ifndef GAZEGUARD_ALERT_SOUND_H
#define GAZEGUARD_ALERT_SOUND_H

#include <memory>
#include <string>
#include <vector>

#include <boost/process/child.hpp>


class AlertPlayer {
    public:
        AlertPlayer(const std::string &player_cmd, const std::string &sound_path);
        ~AlertPlayer();

        void update(bool alert);
        bool is_playing();
        void stop();
        bool disabled() const { return m_disabled; }
        int times_started() const { return m_times_started; }

    private:
        void play();

        std::string m_exe;
        std::vector<std::string> m_args;
        std::unique_ptr<boost::process::child> m_player;
        bool m_disabled;
        int m_times_started;
};


#endif // Top-level include guard
