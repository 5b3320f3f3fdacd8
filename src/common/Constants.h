#pragma once

// Exponential smoothing factor for the fingertip centroid
static constexpr double EMA_ALPHA = 0.45;

// Number of consecutive frames a gesture must be seen before it is confirmed
static constexpr int GESTURE_CONFIDENCE_FRAMES = 3;

// Minimum smoothed displacement (normalised coords) that counts as orbit intent
static constexpr double ORBIT_DEAD_ZONE = 0.015;

// Openness change per second needed to trigger a zoom
static constexpr double ZOOM_SPEED_THRESHOLD = 0.8;

// Orbit is suppressed this long (seconds) after a zoom ends
static constexpr double ORBIT_AFTER_ZOOM_COOLDOWN = 0.3;

// Openness history / speed detection
static constexpr int OPENNESS_HISTORY_CAPACITY = 10;
static constexpr int SPEED_MIN_SAMPLES = 4;
static constexpr double SPEED_MIN_SPAN = 0.05;

// Tip/knuckle ratio range mapped onto openness 0..1 (fist .. open palm)
static constexpr double OPENNESS_RATIO_MIN = 0.6;
static constexpr double OPENNESS_RATIO_MAX = 1.6;

// Openness thresholds used by the classifier
static constexpr double ORBIT_MIN_OPENNESS = 0.55;
static constexpr double ZOOM_IN_SUSTAIN_OPENNESS = 0.7;
static constexpr double ZOOM_OUT_SUSTAIN_OPENNESS = 0.3;

// Viewport output
static constexpr int CAPTURE_WIDTH = 640;
static constexpr int CAPTURE_HEIGHT = 480;
static constexpr double ORBIT_SENSITIVITY_X = 2.5;
static constexpr double ORBIT_SENSITIVITY_Y = 2.5;
static constexpr int ZOOM_IN_SCROLL = 3;
static constexpr int ZOOM_OUT_SCROLL = -3;
static constexpr double ZOOM_SCROLL_INTERVAL = 0.05;

// Landmarks are normalised image coordinates; larger magnitudes are rejected
static constexpr double LANDMARK_COORD_LIMIT = 10.0;

// Networking defaults
static constexpr int TRACKER_SERVER_PORT = 5555;
static constexpr const char *TRACKER_SERVER_IP = "127.0.0.1";
static constexpr int TRACKER_RECONNECT_MS = 2000;
static constexpr int TRACKER_MAX_LINE_BYTES = 64 * 1024;

// How often the navigation loop polls for a new snapshot
static constexpr int POLL_INTERVAL_MS = 5;

static constexpr const char *DEFAULT_CONFIG_FILE = "config/kido.json";
