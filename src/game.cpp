#include "dropcatch/game.hpp"

#include "dropcatch/session.hpp"

#include <raylib.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace dropcatch
{

namespace
{

enum class Button
{
    Left,
    Right,
    Pause,
    Restart,
    Debug,
    Physics,
    WindLeft,
    WindRight
};

constexpr float kButtonPressSeconds = 0.2f;
constexpr float kWindowMargin = 20.0f;
constexpr float kLineHeight = 25.0f;
constexpr size_t kMaxCachedTextWidths = 256;
constexpr double kNanosPerSecond = 1e9;

struct ButtonLabel
{
    Button button;
    float x;
    const char* text;
};

class DropGame
{
public:
    explicit DropGame(const AppConfig& cfg)
        : m_cfg(cfg),
          m_width(cfg.width),
          m_height(cfg.height),
          m_seed(ResolveSeed(cfg)),
          m_session(MakeSettings(cfg, m_seed)),
          m_classic(m_seed, RuleSet::Production, cfg.lives)
    {
    }

    ~DropGame()
    {
        UnloadAssets();
        if (IsWindowReady()) CloseWindow();
    }

    DropGame(const DropGame&) = delete;
    DropGame& operator=(const DropGame&) = delete;

    void Run()
    {
        spdlog::info("Initializing drop game in {} mode...", ToString(m_cfg.mode));
        if (!Classic()) m_session.Start();

        SetTraceLogLevel(LOG_WARNING);
        InitWindow(m_width, m_height, Classic() ? "DropCatch - Classic" : "DropCatch - P: Debug | Q/E: Wind");
        SetTargetFPS(m_cfg.fps);
        LoadAssets();
        PrintControls();

        while (!WindowShouldClose())
        {
            float dt = GetFrameTime();
            Update(dt);
            Draw();
        }

        spdlog::info("Final score: {} (high {})", Score().score, Score().highScore);
        UnloadAssets();
        CloseWindow();
        m_session.Shutdown();
    }

private:
    AppConfig m_cfg;
    int m_width = 800;
    int m_height = 500;
    uint32_t m_seed = 0;
    PhysicsSession m_session;
    ReferenceSession m_classic;
    int64_t m_classicNanos = 0;

    bool m_showDebug = false;
    std::unordered_map<int, float> m_buttonTimers;

    Texture2D m_background{};
    Texture2D m_bucketTexture{};
    Texture2D m_dropTexture{};
    Sound m_dropSound{};
    Music m_music{};
    bool m_audioReady = false;
    bool m_dropSoundLoaded = false;
    bool m_musicLoaded = false;

    Font m_uiFont{};
    bool m_uiFontLoaded = false;
    mutable std::unordered_map<std::string, float> m_textWidthCache;

    static uint32_t ResolveSeed(const AppConfig& cfg)
    {
        if (cfg.seed >= 0) return static_cast<uint32_t>(cfg.seed);
        std::random_device rd;
        return rd();
    }

    static SessionSettings MakeSettings(const AppConfig& cfg, uint32_t seed)
    {
        SessionSettings s;
        s.worldWidthPx = static_cast<float>(cfg.width);
        s.worldHeightPx = static_cast<float>(cfg.height);
        s.gravity = cfg.gravity;
        s.subSteps = cfg.subSteps;
        s.spawnInterval = cfg.spawnInterval;
        s.startingLives = cfg.lives;
        s.seed = seed;
        return s;
    }

    void PrintControls() const
    {
        if (Classic())
        {
            spdlog::info("Controls: A/D or arrows move, mouse steers the bucket, SPACE pause, R restart, ESC exit");
            return;
        }
        spdlog::info("Controls: A/D or arrows move, mouse drags the bucket, SPACE pause, R restart, "
                     "P debug overlay, F physics on/off, Q/E wind, ESC exit");
    }

    bool Classic() const
    {
        return m_cfg.mode == GameMode::Classic;
    }

    const ScoreState& Score() const
    {
        return Classic() ? m_classic.Score() : m_session.Score();
    }

    bool Paused() const
    {
        return Classic() ? m_classic.Paused() : m_session.Paused();
    }

    void TogglePause()
    {
        if (Classic()) m_classic.SetPaused(!m_classic.Paused());
        else m_session.SetPaused(!m_session.Paused());
    }

    void RestartGame()
    {
        if (Classic()) m_classic.Restart();
        else m_session.Restart();
    }

    // Physics space is y-up, raylib is y-down.
    Vector2 ToScreen(b2Vec2 px) const
    {
        return {px.x, static_cast<float>(m_height) - px.y};
    }

    b2Vec2 FromScreen(Vector2 screen) const
    {
        return {screen.x, static_cast<float>(m_height) - screen.y};
    }

    std::string AssetPath(const char* name) const
    {
        return m_cfg.assetDir + "/" + name;
    }

    Texture2D LoadOptionalTexture(const char* name)
    {
        std::string path = AssetPath(name);
        if (!FileExists(path.c_str()))
        {
            spdlog::warn("Could not load {}, drawing shapes instead", path);
            return Texture2D{};
        }
        Texture2D tex = LoadTexture(path.c_str());
        if (tex.id == 0)
        {
            spdlog::warn("Could not decode {}, drawing shapes instead", path);
        }
        return tex;
    }

    void LoadAssets()
    {
        InitUIFont();

        m_background = LoadOptionalTexture("background.png");
        m_bucketTexture = LoadOptionalTexture("bucket.png");
        m_dropTexture = LoadOptionalTexture("drop.png");

        if (m_cfg.mute) return;

        InitAudioDevice();
        m_audioReady = IsAudioDeviceReady();
        if (!m_audioReady)
        {
            spdlog::warn("Audio device unavailable, sound disabled");
            return;
        }

        std::string soundPath = AssetPath("drop.mp3");
        if (FileExists(soundPath.c_str()))
        {
            m_dropSound = LoadSound(soundPath.c_str());
            m_dropSoundLoaded = m_dropSound.frameCount > 0;
        }
        if (!m_dropSoundLoaded) spdlog::warn("Could not load {}", soundPath);

        std::string musicPath = AssetPath("music.mp3");
        if (FileExists(musicPath.c_str()))
        {
            m_music = LoadMusicStream(musicPath.c_str());
            m_musicLoaded = m_music.frameCount > 0;
        }
        if (m_musicLoaded)
        {
            m_music.looping = true;
            SetMusicVolume(m_music, 0.3f);
            PlayMusicStream(m_music);
        }
        else
        {
            spdlog::warn("Could not load {}", musicPath);
        }
    }

    void UnloadAssets()
    {
        if (m_background.id > 0) UnloadTexture(m_background);
        if (m_bucketTexture.id > 0) UnloadTexture(m_bucketTexture);
        if (m_dropTexture.id > 0) UnloadTexture(m_dropTexture);
        m_background = Texture2D{};
        m_bucketTexture = Texture2D{};
        m_dropTexture = Texture2D{};

        if (m_dropSoundLoaded)
        {
            UnloadSound(m_dropSound);
            m_dropSoundLoaded = false;
        }
        if (m_musicLoaded)
        {
            UnloadMusicStream(m_music);
            m_musicLoaded = false;
        }
        if (m_audioReady)
        {
            CloseAudioDevice();
            m_audioReady = false;
        }
        if (m_uiFontLoaded)
        {
            UnloadFont(m_uiFont);
            m_uiFontLoaded = false;
        }
    }

    void InitUIFont()
    {
        std::string bundled = AssetPath("font.ttf");
        std::array<const char*, 3> candidates = {
            bundled.c_str(),
            "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
            "/usr/share/fonts/TTF/DejaVuSans.ttf"
        };

        for (const char* path : candidates)
        {
            if (!FileExists(path))
            {
                continue;
            }
            Font f = LoadFontEx(path, 32, nullptr, 0);
            if (f.glyphCount > 0 && f.texture.id > 0)
            {
                m_uiFont = f;
                m_uiFontLoaded = true;
                SetTextureFilter(m_uiFont.texture, TEXTURE_FILTER_BILINEAR);
                break;
            }
        }
        if (!m_uiFontLoaded) spdlog::warn("No TTF font found, using raylib default font");
    }

    float MeasureTextUi(const std::string& text, float fontSize) const
    {
        std::string cacheKey = text;
        cacheKey.push_back('#');
        cacheKey += std::to_string(static_cast<int>(fontSize + 0.5f));
        auto it = m_textWidthCache.find(cacheKey);
        if (it != m_textWidthCache.end())
        {
            return it->second;
        }
        if (m_textWidthCache.size() >= kMaxCachedTextWidths) m_textWidthCache.clear();

        float value = 0.0f;
        if (m_uiFontLoaded)
        {
            value = MeasureTextEx(m_uiFont, text.c_str(), fontSize, 1.0f).x;
        }
        else
        {
            value = static_cast<float>(MeasureText(text.c_str(), static_cast<int>(fontSize)));
        }

        m_textWidthCache.emplace(std::move(cacheKey), value);
        return value;
    }

    void DrawTextUi(const std::string& text, float x, float y, float fontSize, Color color) const
    {
        if (m_uiFontLoaded)
        {
            DrawTextEx(m_uiFont, text.c_str(), {x, y}, fontSize, 1.0f, color);
        }
        else
        {
            DrawText(text.c_str(), static_cast<int>(x), static_cast<int>(y), static_cast<int>(fontSize), color);
        }
    }

    void Highlight(Button b)
    {
        m_buttonTimers[static_cast<int>(b)] = kButtonPressSeconds;
    }

    bool Highlighted(Button b) const
    {
        auto it = m_buttonTimers.find(static_cast<int>(b));
        return it != m_buttonTimers.end() && it->second > 0.0f;
    }

    void UpdateButtonTimers(float dt)
    {
        for (auto& entry : m_buttonTimers)
        {
            entry.second = std::max(0.0f, entry.second - dt);
        }
    }

    FrameInput HandleInput()
    {
        FrameInput in;

        if (IsKeyPressed(KEY_SPACE))
        {
            Highlight(Button::Pause);
            TogglePause();
        }
        if (IsKeyPressed(KEY_R))
        {
            Highlight(Button::Restart);
            RestartGame();
        }

        if (!Classic())
        {
            if (IsKeyPressed(KEY_P))
            {
                Highlight(Button::Debug);
                m_showDebug = !m_showDebug;
                spdlog::info("Physics debug {}", m_showDebug ? "enabled" : "disabled");
            }
            if (IsKeyPressed(KEY_F))
            {
                Highlight(Button::Physics);
                m_session.TogglePhysics();
            }
            if (IsKeyDown(KEY_Q))
            {
                Highlight(Button::WindLeft);
                in.windLeft = true;
            }
            if (IsKeyDown(KEY_E))
            {
                Highlight(Button::WindRight);
                in.windRight = true;
            }
        }

        if (Paused()) return in;

        if (IsKeyDown(KEY_LEFT) || IsKeyDown(KEY_A))
        {
            Highlight(Button::Left);
            in.moveLeft = true;
        }
        if (IsKeyDown(KEY_RIGHT) || IsKeyDown(KEY_D))
        {
            Highlight(Button::Right);
            in.moveRight = true;
        }
        if (IsMouseButtonDown(MOUSE_BUTTON_LEFT))
        {
            in.pointerPx = FromScreen(GetMousePosition());
        }
        return in;
    }

    // Classic bucket input is a direction; the pointer steers towards itself.
    int ClassicDirection(const FrameInput& in) const
    {
        if (in.pointerPx)
        {
            float target = in.pointerPx->x * rules::kScreenWidth / static_cast<float>(m_width);
            float center = m_classic.State().bucketX + rules::kBucketWidth * 0.5f;
            if (target < center - 2.0f) return -1;
            if (target > center + 2.0f) return 1;
            return 0;
        }
        return (in.moveRight ? 1 : 0) - (in.moveLeft ? 1 : 0);
    }

    void Update(float dt)
    {
        UpdateButtonTimers(dt);
        if (m_musicLoaded) UpdateMusicStream(m_music);

        FrameInput in = HandleInput();
        int caughtBefore = Score().dropsCaught;
        if (Classic())
        {
            m_classicNanos += static_cast<int64_t>(static_cast<double>(dt) * kNanosPerSecond);
            m_classic.Frame(dt, m_classicNanos, ClassicDirection(in));
        }
        else
        {
            m_session.Frame(in, dt);
        }
        if (m_dropSoundLoaded && Score().dropsCaught > caughtBefore)
        {
            PlaySound(m_dropSound);
        }
    }

    void DrawSprite(const Texture2D& tex, Vector2 center, float w, float h, Color fallback, bool circle) const
    {
        if (tex.id > 0)
        {
            Rectangle src{0.0f, 0.0f, static_cast<float>(tex.width), static_cast<float>(tex.height)};
            Rectangle dst{center.x - w * 0.5f, center.y - h * 0.5f, w, h};
            DrawTexturePro(tex, src, dst, {0.0f, 0.0f}, 0.0f, WHITE);
            return;
        }
        if (circle)
        {
            DrawCircleV(center, w * 0.5f, fallback);
        }
        else
        {
            DrawRectangleRec({center.x - w * 0.5f, center.y - h * 0.5f, w, h}, fallback);
        }
    }

    void DrawWorld()
    {
        if (m_background.id > 0)
        {
            Rectangle src{0.0f, 0.0f, static_cast<float>(m_background.width), static_cast<float>(m_background.height)};
            Rectangle dst{0.0f, 0.0f, static_cast<float>(m_width), static_cast<float>(m_height)};
            DrawTexturePro(m_background, src, dst, {0.0f, 0.0f}, 0.0f, WHITE);
        }

        const BodyLifecycle& bodies = m_session.Bodies();
        Vector2 bucket = ToScreen(m_session.BucketPosition());
        DrawSprite(m_bucketTexture, bucket, bodies.BucketWidth(), bodies.BucketHeight(), Color{170, 110, 60, 255}, false);

        for (const DropletView& d : m_session.Droplets())
        {
            float size = d.radiusPx * 2.0f;
            DrawSprite(m_dropTexture, ToScreen(d.positionPx), size, size, Color{120, 190, 255, 230}, true);
        }
    }

    // Rule space is 800x480, y-up, rectangles anchored at their bottom-left.
    Rectangle ClassicToScreen(const rules::Rect& r) const
    {
        const float sx = static_cast<float>(m_width) / rules::kScreenWidth;
        const float sy = static_cast<float>(m_height) / rules::kScreenHeight;
        return {r.x * sx, static_cast<float>(m_height) - (r.y + r.height) * sy, r.width * sx, r.height * sy};
    }

    void DrawClassicRect(const Texture2D& tex, const rules::Rect& r, Color fallback) const
    {
        Rectangle dst = ClassicToScreen(r);
        if (tex.id > 0)
        {
            Rectangle src{0.0f, 0.0f, static_cast<float>(tex.width), static_cast<float>(tex.height)};
            DrawTexturePro(tex, src, dst, {0.0f, 0.0f}, 0.0f, WHITE);
            return;
        }
        DrawRectangleRec(dst, fallback);
    }

    void DrawClassicWorld()
    {
        if (m_background.id > 0)
        {
            Rectangle src{0.0f, 0.0f, static_cast<float>(m_background.width), static_cast<float>(m_background.height)};
            Rectangle dst{0.0f, 0.0f, static_cast<float>(m_width), static_cast<float>(m_height)};
            DrawTexturePro(m_background, src, dst, {0.0f, 0.0f}, 0.0f, WHITE);
        }

        const rules::PureGameState& state = m_classic.State();
        DrawClassicRect(m_bucketTexture, rules::BucketRect(state), Color{170, 110, 60, 255});
        for (const rules::Rect& drop : state.droplets)
        {
            DrawClassicRect(m_dropTexture, drop, Color{120, 190, 255, 230});
        }
    }

    void DrawPhysicsDebug()
    {
        const Color stroke{80, 255, 120, 220};
        const BodyLifecycle& bodies = m_session.Bodies();
        for (const BoxView& b : bodies.Boundaries())
        {
            Vector2 c = ToScreen(b.centerPx);
            Rectangle r{c.x - b.halfWidthPx, c.y - b.halfHeightPx, b.halfWidthPx * 2.0f, b.halfHeightPx * 2.0f};
            DrawRectangleLinesEx(r, 1.5f, (b.role == BodyRole::Ground) ? Color{255, 120, 80, 220} : stroke);
            if (b.role == BodyRole::Ground)
            {
                DrawTextUi(ToString(b.role), c.x - 20.0f, c.y - b.halfHeightPx - 18.0f, 14.0f, stroke);
            }
        }

        Vector2 bucket = ToScreen(m_session.BucketPosition());
        float bw = bodies.BucketWidth();
        float bh = bodies.BucketHeight();
        DrawRectangleLinesEx({bucket.x - bw * 0.5f, bucket.y - bh * 0.5f, bw, bh}, 1.5f, stroke);

        for (const DropletView& d : m_session.Droplets())
        {
            DrawCircleLinesV(ToScreen(d.positionPx), d.radiusPx, stroke);
        }
    }

    static std::string FormatTime(float seconds)
    {
        int total = static_cast<int>(seconds);
        return TextFormat("%02d:%02d", total / 60, total % 60);
    }

    Color LabelColor(Button b, Color normal) const
    {
        return Highlighted(b) ? YELLOW : normal;
    }

    void DrawControls()
    {
        const float fs = 16.0f;
        const float y = static_cast<float>(m_height) - (kWindowMargin + 60.0f);

        std::array<ButtonLabel, 4> row = {{
            {Button::Left, kWindowMargin, "< LEFT (A)"},
            {Button::Right, kWindowMargin + 110.0f, "RIGHT (D) >"},
            {Button::Pause, kWindowMargin + 230.0f, Paused() ? "PLAY (SPACE)" : "PAUSE (SPACE)"},
            {Button::Restart, kWindowMargin + 370.0f, "RESTART (R)"}
        }};
        for (const ButtonLabel& b : row)
        {
            DrawTextUi(b.text, b.x, y, fs, LabelColor(b.button, RAYWHITE));
        }

        if (Classic()) return;

        const float y2 = y + 22.0f;
        DrawTextUi(m_showDebug ? "P: Debug ON" : "P: Debug OFF", kWindowMargin, y2, fs,
                   LabelColor(Button::Debug, m_showDebug ? GREEN : RAYWHITE));
        DrawTextUi(m_session.World().Enabled() ? "F: Physics ON" : "F: Physics OFF", kWindowMargin + 130.0f, y2, fs,
                   LabelColor(Button::Physics, m_session.World().Enabled() ? GREEN : RED));
        DrawTextUi("Q: Wind <", kWindowMargin + 270.0f, y2, fs, LabelColor(Button::WindLeft, RAYWHITE));
        DrawTextUi("E: Wind >", kWindowMargin + 370.0f, y2, fs, LabelColor(Button::WindRight, RAYWHITE));
    }

    void DrawHud()
    {
        const ScoreState& s = Score();
        const float w = static_cast<float>(m_width);
        const float h = static_cast<float>(m_height);

        DrawTextUi(Classic() ? "CLASSIC DROP GAME" : "BOX2D PHYSICS DROP GAME", w / 6.0f, kWindowMargin * 0.5f, 28.0f,
                   YELLOW);

        DrawTextUi(TextFormat("SCORE: %d", s.score), kWindowMargin, kLineHeight * 2.0f, 22.0f, SKYBLUE);
        DrawTextUi(TextFormat("HIGH: %d", s.highScore), kWindowMargin, kLineHeight * 3.0f, 22.0f, GOLD);

        const float right = w - 170.0f;
        DrawTextUi("Time: " + FormatTime(s.gameTime), right, kLineHeight * 2.0f, 18.0f, RAYWHITE);
        DrawTextUi(TextFormat("Caught: %d", s.dropsCaught), right, kLineHeight * 3.0f, 18.0f, RAYWHITE);
        int dropCount = Classic() ? static_cast<int>(m_classic.State().droplets.size())
                                  : static_cast<int>(m_session.Bodies().DropletCount());
        DrawTextUi(TextFormat(Classic() ? "Drops: %d" : "Physics Bodies: %d", dropCount), right, kLineHeight * 4.0f,
                   18.0f, RAYWHITE);

        if (s.lives != kUnlimitedLives)
        {
            DrawTextUi(TextFormat("LIVES: %d", s.lives), kWindowMargin, kLineHeight * 4.0f, 22.0f,
                       (s.lives <= 1) ? RED : RAYWHITE);
        }
        DrawTextUi(TextFormat("Speed: %.2f", s.gameSpeed), kWindowMargin, kLineHeight * 5.0f, 18.0f, RAYWHITE);

        if (s.multiplier > 1)
        {
            DrawTextUi(TextFormat("MULTIPLIER x%d", s.multiplier), w - 220.0f, kLineHeight * 5.0f, 22.0f, ORANGE);
        }

        if (s.showCombo)
        {
            std::string combo = TextFormat("COMBO x%d", s.comboCount);
            DrawTextUi(combo, (w - MeasureTextUi(combo, 34.0f)) * 0.5f, h * 0.5f - 20.0f, 34.0f, RED);
        }

        if (s.gameOver)
        {
            std::string over = "GAME OVER - R TO RESTART";
            DrawTextUi(over, (w - MeasureTextUi(over, 34.0f)) * 0.5f, h * 0.5f + 20.0f, 34.0f, RED);
        }
        else if (Paused())
        {
            std::string paused = "GAME PAUSED";
            DrawTextUi(paused, (w - MeasureTextUi(paused, 34.0f)) * 0.5f, h * 0.5f + 20.0f, 34.0f, RED);
        }

        if (std::optional<float> acc = Accuracy(s))
        {
            Color c = (*acc >= 90.0f) ? GREEN : ((*acc >= 70.0f) ? YELLOW : RED);
            DrawTextUi(TextFormat("Accuracy: %.1f%%", *acc), kWindowMargin, h - kWindowMargin - 16.0f, 16.0f, c);
        }

        DrawControls();
    }

    void Draw()
    {
        BeginDrawing();
        ClearBackground(Color{26, 77, 204, 255});

        if (Classic())
        {
            DrawClassicWorld();
        }
        else
        {
            DrawWorld();
            if (m_showDebug) DrawPhysicsDebug();
        }
        DrawHud();

        EndDrawing();
    }
};

} // namespace

void RunGame(const AppConfig& cfg)
{
    DropGame game(cfg);
    game.Run();
}

} // namespace dropcatch
