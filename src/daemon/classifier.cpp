#include "daemon/classifier.hpp"

#include <algorithm>
#include <cctype>

namespace timekeep {

namespace {

bool containsAny(const std::string &lowered, const std::vector<const char *> &keywords)
{
    for (const char *keyword : keywords) {
        if (lowered.find(keyword) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::vector<Classifier::KeywordGroup> makeBuiltInGroups()
{
    std::vector<Classifier::KeywordGroup> groups;

    groups.push_back({"Coding", {
        // IDEs
        "vscode", "visual studio code", "pycharm", "intellij", "webstorm", "phpstorm",
        "goland", "rider", "clion", "datagrip", "rubymine", "appcode",
        "eclipse", "netbeans", "android studio", "xcode", "sublime", "atom",
        "brackets", "notepad++", "vim", "emacs", "nano", "gedit",
        "code.exe", "code - insiders",
        "jupyter", "spyder", "rstudio", "matlab", "octave",
        "postman", "insomnia", "swagger",
        // Terminals
        "terminal", "iterm", "cmd.exe", "powershell", "wsl", "bash", "zsh",
        "windows terminal", "hyper", "alacritty", "kitty", "terminator",
        "putty", "winscp", "filezilla",
        // Version control
        "gitkraken", "sourcetree", "github desktop", "tower", "smartgit",
        "tortoisegit", "git gui",
        // Databases
        "dbeaver", "mysql workbench", "pgadmin", "sequel pro", "tableplus",
        "mongodb compass", "redis", "robo 3t",
        "docker", "kubernetes", "vagrant", "virtualbox", "vmware",
        "wireshark", "fiddler", "charles proxy",
    }, {}});

    groups.push_back({"Browsing", {
        "chrome", "firefox", "safari", "edge", "brave", "opera",
        "vivaldi", "arc", "chromium", "iexplore", "internet explorer",
    }, {
        {"Coding", {
            "github", "gitlab", "bitbucket", "stackoverflow", "stack overflow",
            "leetcode", "hackerrank", "codepen", "codesandbox", "repl.it", "jsfiddle",
            "glitch", "stackblitz", "playcode", "codeanywhere",
            "mdn", "w3schools", "devdocs", "docs.python", "docs.microsoft",
            "developer.mozilla", "documentation", "api reference", "tutorial",
            "udemy", "coursera", "edx", "pluralsight", "skillshare", "freecodecamp",
            "khan academy", "codecademy", "udacity", "egghead", "frontend masters",
            "laracasts", "treehouse", "lynda", "datacamp", "educative",
            "vercel", "netlify", "heroku", "railway", "render", "fly.io",
            "aws console", "azure portal", "google cloud", "digitalocean",
            "cloudflare", "mongodb atlas", "supabase", "planetscale",
            "sentry", "datadog", "new relic", "grafana", "prometheus",
        }},
        {"Social Media", {
            "facebook", "twitter", "instagram", "tiktok", "snapchat",
            "reddit", "pinterest", "tumblr", "linkedin", "mastodon",
            "threads", "bluesky", "whatsapp web", "telegram web",
        }},
        {"Entertainment", {
            "youtube", "netflix", "twitch", "hulu", "disney", "prime video",
            "spotify", "soundcloud", "apple music", "pandora", "tidal",
            "crunchyroll", "funimation", "hbo", "peacock", "paramount",
        }},
        {"Reading", {
            "news", "bbc", "cnn", "nytimes", "guardian", "reuters", "medium",
            "substack", "forbes", "techcrunch", "hacker news", "ycombinator",
            "wikipedia", "wikihow",
        }},
        {"Shopping", {
            "amazon", "ebay", "etsy", "aliexpress", "walmart", "target",
            "shop", "store", "cart", "checkout",
        }},
        {"Productivity", {
            "gmail", "outlook", "calendar", "google docs", "google sheets",
            "google drive", "dropbox", "notion", "todoist", "trello",
            "asana", "jira", "monday.com", "clickup", "linear", "airtable",
            "coda", "miro", "figma", "figjam", "whimsical", "lucidchart",
            "canva - edit", "excalidraw", "obsidian publish",
        }},
    }});

    groups.push_back({"Communication", {
        "slack", "discord", "teams", "microsoft teams", "zoom", "skype",
        "telegram", "whatsapp", "signal", "element", "matrix",
        "messenger", "wechat", "line", "viber", "groupme", "rocketchat",
        "mattermost", "zulip", "gitter", "chanty", "flock",
        // Mail
        "thunderbird", "outlook", "mail", "spark", "mailspring",
        "mailbird", "em client", "postbox", "claws mail",
        // Video calls
        "webex", "gotomeeting", "bluejeans", "jitsi", "meet",
        "facetime", "google meet", "whereby", "around", "mmhmm",
        "discord - voice", "hangouts",
    }, {}});

    groups.push_back({"Productivity", {
        "word", "winword", "excel", "powerpoint", "onenote", "access",
        "publisher", "outlook", "microsoft 365", "office", "teams - calendar",
        "google docs", "google sheets", "google slides", "google drive",
        "google calendar", "google keep",
        "pages", "numbers", "keynote", "reminders",
        "libreoffice", "openoffice", "wps office", "calligra", "onlyoffice",
        // Notes
        "notion", "obsidian", "evernote", "simplenote",
        "bear", "roam", "logseq", "joplin", "standard notes", "remnote",
        "typora", "mark text", "notable", "craft", "amplenote", "mem",
        "reflect", "tana", "capacities", "anytype",
        "acrobat", "pdf", "foxit", "preview", "sumatra", "pdf-xchange",
        // Planning
        "trello", "asana", "monday", "clickup", "basecamp", "notion calendar",
        "jira", "confluence", "linear", "height", "shortcut", "pivotal tracker",
        "youtrack", "airtable", "smartsheet", "wrike", "teamwork",
        "todoist", "things", "any.do", "microsoft to do", "ticktick",
        "omnifocus", "taskwarrior", "2do", "remember the milk",
        "coda", "notion database", "fibery",
        "toggl", "rescuetime", "timely", "clockify", "harvest",
        "miro", "mural", "figjam", "whimsical", "lucidchart", "draw.io",
        "excalidraw", "tldraw",
    }, {}});

    groups.push_back({"Design", {
        "photoshop", "illustrator", "indesign", "lightroom", "acrobat",
        "gimp", "inkscape", "krita", "affinity photo", "affinity designer",
        "sketch", "figma", "adobe xd", "invision", "framer", "pixelmator",
        "paint.net", "paintshop", "corel draw", "canva", "penpot",
        "lunacy", "photopea", "fotor", "pixlr",
        // Video
        "premiere", "after effects", "davinci resolve", "final cut",
        "imovie", "filmora", "camtasia", "shotcut", "kdenlive",
        "vegas", "avid", "blender", "olive", "openshot",
        // 3D
        "maya", "cinema 4d", "zbrush", "houdini", "3ds max",
        "unity", "unreal", "godot", "substance painter", "marmoset",
        // Audio
        "audacity", "logic pro", "ableton", "fl studio", "reaper",
        "pro tools", "garage band", "cubase", "studio one", "ardour",
        "lmms", "caustic",
        "axure", "balsamiq", "mockplus",
        "principle", "protopie", "flinto", "origami studio",
    }, {}});

    groups.push_back({"Entertainment", {
        "spotify", "apple music", "itunes", "music", "vlc", "windows media",
        "quicktime", "netflix", "youtube", "twitch", "hulu", "disney+",
        "plex", "kodi", "jellyfin", "emby", "amazon prime video",
        "hbo max", "paramount+", "peacock", "apple tv", "crunchyroll",
        // Launchers
        "steam", "epic games", "epicgameslauncher", "gog galaxy", "origin", "uplay",
        "battle.net", "battlenet", "blizzard", "riot client", "riotclientservices",
        "xbox", "playstation", "ea app", "rockstar games launcher",
        "bethesda launcher", "itch.io", "playnite",
        // Games
        "minecraft", "fortnite", "valorant", "league of legends", "leagueoflegends",
        "dota", "dota2", "counter-strike", "csgo", "cs2", "overwatch",
        "apex legends", "apexlegends", "rocket league", "roblox", "among us",
        "fall guys", "wow", "world of warcraft", "destiny", "call of duty",
        "gta", "grand theft auto", "red dead", "elden ring", "baldurs gate",
        "cyberpunk", "witcher", "skyrim", "fallout", "halo", "warzone",
        "game", ".exe - ",
        "soundcloud", "pandora", "tidal", "deezer", "youtube music",
        "foobar2000", "winamp", "clementine", "rhythmbox",
    }, {}});

    groups.push_back({"Social Media", {
        "facebook", "twitter", "instagram", "tiktok", "snapchat",
        "reddit", "pinterest", "linkedin", "mastodon", "threads",
    }, {}});

    groups.push_back({"Education", {
        "anki", "quizlet", "duolingo", "rosetta stone",
        "mathematica", "maple", "geogebra", "desmos",
        "moodle", "canvas", "blackboard", "schoology",
        "zoom", "google classroom",
    }, {}});

    groups.push_back({"Utilities", {
        "calculator", "notepad", "textedit", "finder", "explorer",
        "settings", "control panel", "system preferences",
        "task manager", "activity monitor", "resource monitor",
        "7-zip", "winrar", "winzip", "archive utility",
        "snipping tool", "screenshot", "greenshot", "lightshot",
    }, {}});

    groups.push_back({"Finance", {
        "quickbooks", "quicken", "mint", "ynab", "personal capital",
        "coinbase", "robinhood", "webull", "etrade", "fidelity",
        "paypal", "venmo", "cash app", "crypto",
    }, {}});

    groups.push_back({"Reading", {
        "kindle", "apple books", "calibre", "goodreads",
        "pocket", "instapaper", "readwise", "reader",
    }, {}});

    return groups;
}

} // namespace

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

bool containsCaseInsensitive(const std::string &value, const std::string &needle)
{
    return toLower(value).find(toLower(needle)) != std::string::npos;
}

bool matchesAnyPattern(const std::string &value, const std::vector<std::string> &patterns)
{
    const std::string lowered = toLower(value);
    for (const auto &pattern : patterns) {
        if (pattern.empty()) {
            continue;
        }
        if (lowered.find(toLower(pattern)) != std::string::npos) {
            return true;
        }
    }
    return false;
}

Classifier::Classifier(CustomRules customRules)
    : m_customRules(std::move(customRules))
{
}

const std::vector<Classifier::KeywordGroup> &Classifier::builtInGroups()
{
    static const std::vector<KeywordGroup> groups = makeBuiltInGroups();
    return groups;
}

std::string Classifier::classify(const std::string &appId) const
{
    const std::string lowered = toLower(appId);

    // First matching user rule wins; rules are never re-sorted.
    for (const auto &[pattern, category] : m_customRules) {
        if (pattern.empty()) {
            continue;
        }
        if (lowered.find(toLower(pattern)) != std::string::npos) {
            return category;
        }
    }

    return classifyBuiltIn(appId);
}

std::string Classifier::classifyBuiltIn(const std::string &appId)
{
    const std::string lowered = toLower(appId);
    if (lowered.empty()) {
        return kOtherCategory;
    }

    for (const auto &group : builtInGroups()) {
        if (!containsAny(lowered, group.keywords)) {
            continue;
        }
        for (const auto &site : group.sites) {
            if (containsAny(lowered, site.keywords)) {
                return site.category;
            }
        }
        return group.category;
    }

    return kOtherCategory;
}

} // namespace timekeep
