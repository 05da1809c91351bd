#include "cptest.h"
#include "maybe_res.h"

#include <set>
#include <string>
#include <sstream>

using namespace std;
using namespace testing;

static Maybe<int>
parseMaxAge(const string &text)
{
    if (text.empty()) return genError("Empty max-age");
    for (char ch : text) {
        if (ch < '0' || ch > '9') return genError("Illegal max-age: " + text);
    }
    return stoi(text);
}

class ParsingException
{
public:
    ParsingException(const string &_str) : str(_str) {}
    const string & getError() const { return str; }

private:
    string str;
};

TEST(Usage, typical_function)
{
    auto max_age = parseMaxAge("600");
    ASSERT_TRUE(max_age.ok());
    EXPECT_EQ(600, *max_age);
    EXPECT_THAT(max_age, IsValue(600));

    auto bad_max_age = parseMaxAge("10m");
    ASSERT_FALSE(bad_max_age.ok());
    EXPECT_EQ("Illegal max-age: 10m", bad_max_age.getErr());
    EXPECT_THAT(bad_max_age, IsError("Illegal max-age: 10m"));
    EXPECT_THAT(parseMaxAge(""), IsError(_));
}

TEST(genError, builds)
{
    Error<string> explicit_err = genError<string>("error");
    Error<string> implicit_err = genError(string("error"));
    Error<string> literal_err = genError("error");
    EXPECT_TRUE(explicit_err == implicit_err);
    EXPECT_TRUE(implicit_err == literal_err);

    Error<void> err1 = genError<void>();
    Error<void> err2 = genError<void>(5, 6, 7);
    EXPECT_TRUE(err1 == err2);
}

TEST(Maybe, unpack_exception)
{
    Maybe<int> res = 5;
    EXPECT_EQ(5, res.unpack<ParsingException>());

    Maybe<int> err = genError("error");
    try {
        err.unpack<ParsingException>();
        FAIL() << "Error was unpacked";
    } catch (const ParsingException &e) {
        EXPECT_EQ("error", e.getError());
    }

    try {
        err.unpack<ParsingException>("really ", "bad ");
        FAIL() << "Error was unpacked";
    } catch (const ParsingException &e) {
        EXPECT_EQ("really bad error", e.getError());
    }
}

TEST(Maybe, verify)
{
    Maybe<int> res = 5;
    res.verify<ParsingException>();
    res.verify<ParsingException>("context: ");

    Maybe<int> err = genError("error");
    EXPECT_THROW(err.verify<ParsingException>(), ParsingException);
    EXPECT_THROW(err.verify<string>("line ", 7, ": "), string);
    try {
        err.verify<string>("line ", 7, ": ");
    } catch (const string &str) {
        EXPECT_EQ("line 7: error", str);
    }
}

TEST(Maybe, equality)
{
    Maybe<int> a = 1, b = 1, c = 2;
    EXPECT_TRUE(a == b);
    EXPECT_TRUE(a != c);

    Maybe<int> d = genError("error1");
    Maybe<int> e = genError("error2");
    Maybe<int> f = genError("error1");
    EXPECT_TRUE(d == f);
    EXPECT_FALSE(d == e);
    EXPECT_FALSE(a == d);
}

TEST(Maybe, unpack_move)
{
    Maybe<string> res = string("value");
    string moved = res.unpackMove();
    EXPECT_EQ("value", moved);
}

class MaybeAssignments : public Test
{
public:
    // Maybe runs constructors and destructors manually, so every live object is tracked.
    class TrackedValue
    {
    public:
        TrackedValue(int _x) : x(_x) { addObj(this); }
        TrackedValue(const TrackedValue &other) : x(other.x) { addObj(this); }
        ~TrackedValue() { delObj(this); }
        TrackedValue & operator=(const TrackedValue &other) { x = other.x; return *this; }
        bool operator==(const TrackedValue &other) const { return x == other.x; }

        int x;

        static set<const TrackedValue *> objects;

        static void
        addObj(const TrackedValue *obj)
        {
            EXPECT_EQ(objects.end(), objects.find(obj));
            objects.insert(obj);
        }

        static void
        delObj(const TrackedValue *obj)
        {
            EXPECT_NE(objects.end(), objects.find(obj));
            objects.erase(obj);
        }
    };

    MaybeAssignments() { TrackedValue::objects.clear(); }

    ~MaybeAssignments() { EXPECT_THAT(TrackedValue::objects, IsEmpty()); }
};

set<const MaybeAssignments::TrackedValue *> MaybeAssignments::TrackedValue::objects;

ostream &
operator<<(ostream &os, const MaybeAssignments::TrackedValue &value)
{
    return os << value.x;
}

TEST_F(MaybeAssignments, value_to_value)
{
    Maybe<TrackedValue, TrackedValue> m(TrackedValue(1));
    Maybe<TrackedValue, TrackedValue> other(TrackedValue(2));

    m = other;
    EXPECT_EQ(2, m->x);
    m = Maybe<TrackedValue, TrackedValue>(TrackedValue(3));
    EXPECT_EQ(3, m->x);
}

TEST_F(MaybeAssignments, error_to_value)
{
    Maybe<TrackedValue, TrackedValue> m(genError<TrackedValue>(404));
    EXPECT_EQ(TrackedValue(404), m.getErr());

    Maybe<TrackedValue, TrackedValue> other(TrackedValue(3));
    m = other;
    EXPECT_EQ(3, m->x);
}

TEST_F(MaybeAssignments, value_to_error)
{
    Maybe<TrackedValue, TrackedValue> m(TrackedValue(1));
    m = Maybe<TrackedValue, TrackedValue>(genError<TrackedValue>(500));
    EXPECT_EQ(TrackedValue(500), m.getErr());
}

TEST_F(MaybeAssignments, self_assignment)
{
    Maybe<TrackedValue, TrackedValue> m(TrackedValue(1));
    Maybe<TrackedValue, TrackedValue> &same = m;
    m = same;
    EXPECT_EQ(1, m->x);
}

TEST(Maybe, illegal_access)
{
    cptestPrepareToDie();

    Maybe<int> err = genError("error");
    EXPECT_DEATH(*err, "Maybe value is not set");
    EXPECT_DEATH(err.unpack(), "Maybe value is not set");

    Maybe<int> res = 5;
    EXPECT_DEATH(res.getErr(), "Maybe value is set");
}

TEST(Maybe, passing_error)
{
    Maybe<int> err1 = genError("error");
    Maybe<string> err2 = err1.passErr();
    EXPECT_THAT(err2, IsError("error"));

    Maybe<void> err3 = err1.passErr();
    EXPECT_FALSE(err3.ok());
    EXPECT_EQ("error", err3.getErr());
}

TEST(Maybe, maybe_void)
{
    Maybe<void> res;
    EXPECT_TRUE(res.ok());
    EXPECT_NO_THROW(res.verify<ParsingException>());

    Maybe<void> err = genError("error");
    EXPECT_THAT(err, IsError("error"));
    EXPECT_THROW(err.verify<ParsingException>(), ParsingException);
    EXPECT_FALSE(res == err);
}

TEST(Maybe, printing)
{
    ostringstream os;
    Maybe<int> val1 = 5;
    os << val1;
    EXPECT_EQ("Value(5)", os.str());

    os.str("");
    Maybe<void> val2;
    os << val2;
    EXPECT_EQ("Value()", os.str());

    os.str("");
    Maybe<int> err1 = genError("error");
    os << err1;
    EXPECT_EQ("Error(error)", os.str());

    os.str("");
    Maybe<void> err2 = genError("error");
    os << err2;
    EXPECT_EQ("Error(error)", os.str());
}
