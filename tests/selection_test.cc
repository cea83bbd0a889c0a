#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <locale.h>

#include "../appdeck/selection.h"
#include "test_util.h"

using ::testing::ElementsAre;
using ::testing::IsEmpty;

class SelectionTest : public ::testing::Test {
 protected:
  SelectionState state;
  FakeProvider fake;
  AppProvider provider;

  void SetUp() override {
    appdeck_set_log_file(nullptr);
    provider = fake.Provider();
  }

  void TearDown() override { appdeck_set_log_file(stderr); }
};

TEST_F(SelectionTest, InitialState) {
  sel_init(&state, {"Finder", "Safari"});
  EXPECT_EQ(state.mode, SEL_MODE_NORMAL);
  EXPECT_EQ(state.flow, SEL_FLOW_BROWSE);
  EXPECT_EQ(state.selected_index, 0u);
  EXPECT_EQ(state.status, SEL_STATUS_NONE);
  EXPECT_FALSE(state.installed_loaded);
  EXPECT_FALSE(state.should_quit);
  EXPECT_THAT(sel_active_list(&state), ElementsAre("Finder", "Safari"));
}

TEST_F(SelectionTest, AdvanceWrapsBothWays) {
  sel_init(&state, {"Safari", "Mail"});

  sel_advance(&state, SEL_NEXT);
  EXPECT_EQ(state.selected_index, 1u);
  sel_advance(&state, SEL_NEXT);
  EXPECT_EQ(state.selected_index, 0u);
  sel_advance(&state, SEL_PREVIOUS);
  EXPECT_EQ(state.selected_index, 1u);
  ASSERT_NE(sel_selected_name(&state), nullptr);
  EXPECT_EQ(*sel_selected_name(&state), "Mail");
}

TEST_F(SelectionTest, AdvanceFullCycleReturnsToStart) {
  sel_init(&state, {"A", "B", "C", "D", "E"});
  for (size_t start = 0; start < 5; ++start) {
    state.selected_index = start;
    for (int i = 0; i < 5; ++i)
      sel_advance(&state, SEL_NEXT);
    EXPECT_EQ(state.selected_index, start);
    for (int i = 0; i < 5; ++i)
      sel_advance(&state, SEL_PREVIOUS);
    EXPECT_EQ(state.selected_index, start);
  }
}

TEST_F(SelectionTest, AdvanceOnEmptyListIsNoop) {
  sel_init(&state, {});
  sel_advance(&state, SEL_NEXT);
  EXPECT_EQ(state.selected_index, 0u);
  sel_advance(&state, SEL_PREVIOUS);
  EXPECT_EQ(state.selected_index, 0u);
  EXPECT_EQ(sel_selected_name(&state), nullptr);
}

TEST_F(SelectionTest, EnterSearchModeScansOnce) {
  fake.installed = {"Safari", "Notion", "Slack"};
  sel_init(&state, {"Finder"});

  ASSERT_EQ(sel_enter_search_mode(&state, &provider), 0);
  EXPECT_EQ(state.mode, SEL_MODE_SEARCH);
  EXPECT_TRUE(state.installed_loaded);
  EXPECT_THAT(state.filtered_apps, ElementsAre("Safari", "Notion", "Slack"));
  EXPECT_EQ(fake.scan_calls, 1);

  sel_exit_search_mode(&state);
  EXPECT_EQ(state.mode, SEL_MODE_NORMAL);
  EXPECT_THAT(state.installed_apps, ElementsAre("Safari", "Notion", "Slack"));

  // The cache survives; a changed scan result is not picked up.
  fake.installed = {"Other"};
  ASSERT_EQ(sel_enter_search_mode(&state, &provider), 0);
  EXPECT_EQ(fake.scan_calls, 1);
  EXPECT_THAT(state.filtered_apps, ElementsAre("Safari", "Notion", "Slack"));
}

TEST_F(SelectionTest, EmptyScanResultIsCached) {
  sel_init(&state, {"Finder"});
  ASSERT_EQ(sel_enter_search_mode(&state, &provider), 0);
  EXPECT_TRUE(state.installed_loaded);
  EXPECT_THAT(state.filtered_apps, IsEmpty());
  EXPECT_EQ(sel_selected_name(&state), nullptr);

  sel_exit_search_mode(&state);
  ASSERT_EQ(sel_enter_search_mode(&state, &provider), 0);
  EXPECT_EQ(fake.scan_calls, 1);
}

TEST_F(SelectionTest, ScanFailureLeavesStateUnchanged) {
  fake.scan_status = PROVIDER_ERR_ISSUE;
  sel_init(&state, {"Finder", "Safari"});
  state.selected_index = 1;

  EXPECT_EQ(sel_enter_search_mode(&state, &provider), -1);
  EXPECT_EQ(state.mode, SEL_MODE_NORMAL);
  EXPECT_FALSE(state.installed_loaded);
  EXPECT_EQ(state.selected_index, 1u);
  EXPECT_THAT(state.installed_apps, IsEmpty());

  // A later attempt scans again.
  fake.scan_status = PROVIDER_OK;
  fake.installed = {"Notes"};
  EXPECT_EQ(sel_enter_search_mode(&state, &provider), 0);
  EXPECT_EQ(fake.scan_calls, 2);
}

TEST_F(SelectionTest, QueryFiltersCaseInsensitively) {
  fake.installed = {"Safari", "Notion", "Slack"};
  sel_init(&state, {});
  ASSERT_EQ(sel_enter_search_mode(&state, &provider), 0);

  sel_edit_query(&state, SEL_QUERY_APPEND, 's');
  EXPECT_EQ(state.search_query, "s");
  EXPECT_THAT(state.filtered_apps, ElementsAre("Safari", "Slack"));
  EXPECT_EQ(state.selected_index, 0u);

  sel_edit_query(&state, SEL_QUERY_APPEND, 'L');
  EXPECT_THAT(state.filtered_apps, ElementsAre("Slack"));

  sel_edit_query(&state, SEL_QUERY_BACKSPACE);
  sel_edit_query(&state, SEL_QUERY_BACKSPACE);
  EXPECT_EQ(state.search_query, "");
  EXPECT_EQ(state.filtered_apps, state.installed_apps);
}

TEST_F(SelectionTest, LongerQueryNarrowsMatches) {
  fake.installed = {"Google Chrome", "Chess", "Calendar", "Preview", "Photo Booth", "TextEdit"};
  sel_init(&state, {});
  ASSERT_EQ(sel_enter_search_mode(&state, &provider), 0);

  std::vector<std::string> previous = state.filtered_apps;
  for (char c : std::string("che")) {
    sel_edit_query(&state, SEL_QUERY_APPEND, (uint32_t)c);
    // Every match of the longer query was a match of the shorter one, in order.
    size_t pos = 0;
    for (const std::string& app : state.filtered_apps) {
      while (pos < previous.size() && previous[pos] != app)
        pos++;
      ASSERT_LT(pos, previous.size()) << app << " appeared with a longer query";
    }
    previous = state.filtered_apps;
  }
  EXPECT_THAT(state.filtered_apps, ElementsAre("Chess"));
}

TEST_F(SelectionTest, FilterClampsSelection) {
  fake.installed = {"Safari", "Notion", "Slack"};
  sel_init(&state, {});
  ASSERT_EQ(sel_enter_search_mode(&state, &provider), 0);
  state.selected_index = 2;

  sel_edit_query(&state, SEL_QUERY_APPEND, 's');
  EXPECT_EQ(state.selected_index, 1u);

  sel_edit_query(&state, SEL_QUERY_APPEND, 'z');
  EXPECT_THAT(state.filtered_apps, IsEmpty());
  EXPECT_EQ(state.selected_index, 0u);
  EXPECT_EQ(sel_selected_name(&state), nullptr);
}

TEST_F(SelectionTest, BackspaceRemovesWholeCodePoint) {
  sel_init(&state, {});
  ASSERT_EQ(sel_enter_search_mode(&state, &provider), 0);

  sel_edit_query(&state, SEL_QUERY_APPEND, 'a');
  sel_edit_query(&state, SEL_QUERY_APPEND, 0x00E9);   // é
  sel_edit_query(&state, SEL_QUERY_APPEND, 0x1F3B5);  // 🎵
  EXPECT_EQ(state.search_query, "a\xC3\xA9\xF0\x9F\x8E\xB5");

  sel_edit_query(&state, SEL_QUERY_BACKSPACE);
  EXPECT_EQ(state.search_query, "a\xC3\xA9");
  sel_edit_query(&state, SEL_QUERY_BACKSPACE);
  EXPECT_EQ(state.search_query, "a");
}

TEST_F(SelectionTest, BackspaceOnEmptyQueryIsNoop) {
  fake.installed = {"Safari"};
  sel_init(&state, {});
  ASSERT_EQ(sel_enter_search_mode(&state, &provider), 0);

  sel_edit_query(&state, SEL_QUERY_BACKSPACE);
  EXPECT_EQ(state.search_query, "");
  EXPECT_THAT(state.filtered_apps, ElementsAre("Safari"));
}

TEST_F(SelectionTest, ExitSearchModeResetsQueryAndSelection) {
  fake.installed = {"Safari", "Slack"};
  sel_init(&state, {"Finder"});
  ASSERT_EQ(sel_enter_search_mode(&state, &provider), 0);
  sel_edit_query(&state, SEL_QUERY_APPEND, 's');
  sel_advance(&state, SEL_NEXT);

  sel_exit_search_mode(&state);
  EXPECT_EQ(state.mode, SEL_MODE_NORMAL);
  EXPECT_EQ(state.search_query, "");
  EXPECT_EQ(state.selected_index, 0u);
  EXPECT_THAT(sel_active_list(&state), ElementsAre("Finder"));
}

TEST_F(SelectionTest, StatusClearsAfterDuration) {
  sel_init(&state, {"Safari"});
  state.status_duration = 5;

  sel_record_opened(&state, "Safari");
  EXPECT_EQ(state.status, SEL_STATUS_OPENED);
  EXPECT_EQ(state.status_name, "Safari");
  for (int i = 0; i < 4; ++i)
    sel_tick_status(&state);
  EXPECT_EQ(state.status, SEL_STATUS_OPENED);
  EXPECT_EQ(state.status_countdown, 1);

  sel_tick_status(&state);
  EXPECT_EQ(state.status, SEL_STATUS_NONE);
  EXPECT_EQ(state.status_name, "");
  EXPECT_EQ(state.status_countdown, 0);

  // Ticking an idle status does nothing.
  sel_tick_status(&state);
  EXPECT_EQ(state.status_countdown, 0);
}

TEST_F(SelectionTest, NewStatusRestartsCountdown) {
  sel_init(&state, {"Safari", "Mail"});
  sel_record_opened(&state, "Safari");
  for (int i = 0; i < 10; ++i)
    sel_tick_status(&state);

  sel_record_killed(&state, "Mail");
  EXPECT_EQ(state.status, SEL_STATUS_KILLED);
  EXPECT_EQ(state.status_name, "Mail");
  EXPECT_EQ(state.status_countdown, APPDECK_STATUS_TICKS);
}

TEST_F(SelectionTest, RefreshClampsSelection) {
  sel_init(&state, {"A", "B", "C", "D"});
  for (size_t prior = 0; prior < 4; ++prior) {
    state.selected_index = prior;
    sel_refresh_running(&state, {"A", "B"});
    EXPECT_EQ(state.selected_index, prior < 2 ? prior : 1u);
    sel_refresh_running(&state, {"A", "B", "C", "D"});
  }

  state.selected_index = 3;
  sel_refresh_running(&state, {});
  EXPECT_EQ(state.selected_index, 0u);
  EXPECT_EQ(sel_selected_name(&state), nullptr);
}

TEST_F(SelectionTest, Utf8Append) {
  std::string s;
  utf8_append(&s, 'A');
  utf8_append(&s, 0x00F1);  // ñ
  utf8_append(&s, 0x20AC);  // €
  EXPECT_EQ(s, "A\xC3\xB1\xE2\x82\xAC");
}

class SelectionLocaleTest : public SelectionTest {
 protected:
  void SetUp() override {
    SelectionTest::SetUp();
    if (!setlocale(LC_CTYPE, "C.UTF-8") && !setlocale(LC_CTYPE, "en_US.UTF-8"))
      GTEST_SKIP() << "no UTF-8 locale available";
  }

  void TearDown() override {
    setlocale(LC_CTYPE, "C");
    SelectionTest::TearDown();
  }
};

TEST_F(SelectionLocaleTest, QueryFoldsNonAsciiCase) {
  fake.installed = {"Éditeur", "Über", "Safari"};
  sel_init(&state, {});
  ASSERT_EQ(sel_enter_search_mode(&state, &provider), 0);

  sel_edit_query(&state, SEL_QUERY_APPEND, 0x00E9);  // é
  EXPECT_THAT(state.filtered_apps, ElementsAre("Éditeur"));

  sel_edit_query(&state, SEL_QUERY_BACKSPACE);
  sel_edit_query(&state, SEL_QUERY_APPEND, 0x00FC);  // ü
  EXPECT_THAT(state.filtered_apps, ElementsAre("Über"));

  sel_edit_query(&state, SEL_QUERY_BACKSPACE);
  sel_edit_query(&state, SEL_QUERY_APPEND, 0x00C9);  // É
  sel_edit_query(&state, SEL_QUERY_APPEND, 'D');
  EXPECT_THAT(state.filtered_apps, ElementsAre("Éditeur"));
}
